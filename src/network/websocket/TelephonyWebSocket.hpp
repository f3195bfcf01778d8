#pragma once
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <memory>
#include <string>

#include "Channels.hpp"
#include "Types.hpp"
#include "spdlog/spdlog.h"

namespace voxbridge {

/**
 * @brief Server side of the telephony media stream (the provider dials in).
 * @details
 * Accepts the upgrade request it was created with once `Start` names a listener,
 * then reads text frames until the peer goes away. The listener hears about the
 * end exactly once, whoever initiated it.
 */
class TelephonyWebSocket : public ITelephonyChannel,
                           public std::enable_shared_from_this<TelephonyWebSocket> {
    websocket::stream<beast::tcp_stream> ws_;
    http::request<http::string_body> upgrade_;
    beast::flat_buffer buffer_;
    std::deque<std::shared_ptr<std::string>> send_queue_;
    std::weak_ptr<ITelephonyListener> listener_;
    bool accepted_ = false;
    bool close_requested_ = false;
    bool closed_ = false;

   public:
    TelephonyWebSocket(tcp::socket&& socket, http::request<http::string_body> upgrade)
        : ws_(std::move(socket)), upgrade_(std::move(upgrade)) {}

    asio::any_io_executor get_executor() { return ws_.get_executor(); }

    void Start(std::weak_ptr<ITelephonyListener> listener) override {
        listener_ = std::move(listener);
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.async_accept(upgrade_, beast::bind_front_handler(&TelephonyWebSocket::on_accept,
                                                             shared_from_this()));
    }

    /**
     * @brief Serialized sending. Beast allows one write in flight, so messages
     * queue here and go out in order.
     */
    void Send(std::string message) override {
        auto msg_ptr = std::make_shared<std::string>(std::move(message));
        asio::post(ws_.get_executor(), [self = shared_from_this(), msg_ptr]() {
            if (self->close_requested_ || self->closed_) return;
            bool writing = !self->send_queue_.empty();
            self->send_queue_.push_back(msg_ptr);
            if (!writing && self->accepted_) self->do_write();
        });
    }

    /**
     * @brief Starts the close handshake once queued messages are written.
     * Safe to call more than once.
     */
    void Close() override {
        asio::post(ws_.get_executor(), [self = shared_from_this()]() {
            if (self->close_requested_ || self->closed_) return;
            self->close_requested_ = true;
            if (self->send_queue_.empty() || !self->accepted_) self->do_close();
        });
    }

   private:
    void on_accept(beast::error_code ec) {
        if (ec) {
            spdlog::error("Telephony WS accept failed: {}", ec.message());
            return finish(ec.message());
        }
        accepted_ = true;
        spdlog::info("Telephony WS connected");

        if (close_requested_) return do_close();
        if (!send_queue_.empty()) do_write();
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&TelephonyWebSocket::on_read,
                                                          shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == websocket::error::closed) return finish("peer closed");
        if (ec) {
            if (!close_requested_) spdlog::warn("Telephony WS read failed: {}", ec.message());
            return finish(ec.message());
        }

        std::string payload = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if (auto listener = listener_.lock()) {
            listener->OnTelephonyMessage(payload);
        }
        if (!closed_) do_read();
    }

    void do_write() {
        ws_.text(true);
        ws_.async_write(asio::buffer(*send_queue_.front()),
                        beast::bind_front_handler(&TelephonyWebSocket::on_write,
                                                  shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            send_queue_.clear();
            return;
        }
        send_queue_.pop_front();
        if (!send_queue_.empty()) return do_write();
        if (close_requested_) do_close();
    }

    void do_close() {
        if (!accepted_) {
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
            return finish("closed before accept");
        }
        ws_.async_close(websocket::close_code::normal,
                        [self = shared_from_this()](beast::error_code ec) {
                            if (ec) spdlog::debug("Telephony WS close: {}", ec.message());
                            self->finish("closed by server");
                        });
    }

    void finish(const std::string& reason) {
        if (closed_) return;
        closed_ = true;
        send_queue_.clear();
        if (auto listener = listener_.lock()) {
            listener->OnTelephonyClosed(reason);
        }
    }
};

}  // namespace voxbridge
