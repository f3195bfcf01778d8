#pragma once

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>

#include "Router.hpp"
#include "Types.hpp"

namespace voxbridge {

/**
 * @brief One accepted TCP connection while it still speaks HTTP.
 * @details
 * Serves webhook and API requests (keep-alive aware) until the peer goes away,
 * or until a WebSocket upgrade hands the socket to a call session. After a
 * successful handover this object only holds an empty stream and dies with its
 * coroutine.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
   public:
    HttpSession(tcp::socket&& socket, std::shared_ptr<Router> router);

    void run();

   private:
    asio::awaitable<void> serve();

    // Routes an upgrade request. Returns true when the socket was handed over.
    asio::awaitable<bool> hand_over(const req_t& req);

    asio::awaitable<bool> send(res_t& res);
    asio::awaitable<void> close_gracefully();

    beast::tcp_stream stream_;
    std::shared_ptr<Router> router_;
    beast::flat_buffer buffer_;
    std::string peer_;
};

}  // namespace voxbridge
