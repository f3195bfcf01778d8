#pragma once
#include <deque>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "Channels.hpp"
#include "Types.hpp"
#include "config.hpp"

namespace voxbridge {

/**
 * @brief TLS WebSocket client for the AI live session.
 * @details
 * One instance per call. `Open` connects in the background (resolve, TCP, TLS
 * with SNI and host name verification, WebSocket upgrade); anything sent before
 * that finishes is queued and written in order afterwards.
 *
 * All work happens on the executor passed in, which must be the call session's.
 */
class LiveSessionClient : public ILiveChannel, public std::enable_shared_from_this<LiveSessionClient> {
   public:
    LiveSessionClient(asio::any_io_executor executor, std::shared_ptr<ssl::context> tls, LiveConfig cfg);

    void Open(std::weak_ptr<ILiveListener> listener) override;
    void Send(std::string message) override;
    void Close() override;

   private:
    asio::awaitable<void> run();
    asio::awaitable<void> connect();
    asio::awaitable<void> read_loop();

    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes);
    void do_close();
    void finish(const std::string& reason);

    // Request target with the API key appended; never logged.
    std::string target() const;

    asio::any_io_executor executor_;
    std::shared_ptr<ssl::context> tls_;
    LiveConfig cfg_;
    tcp::resolver resolver_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    beast::flat_buffer buffer_;

    std::weak_ptr<ILiveListener> listener_;
    std::deque<std::shared_ptr<std::string>> send_queue_;
    bool open_ = false;
    bool close_requested_ = false;
    bool closed_ = false;
};

}  // namespace voxbridge
