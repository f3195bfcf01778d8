#include "LiveSessionClient.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <exception>

namespace voxbridge {

namespace {

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(15);

// Model audio arrives in large base64 chunks.
constexpr std::size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

}  // namespace

LiveSessionClient::LiveSessionClient(asio::any_io_executor executor, std::shared_ptr<ssl::context> tls,
                                     LiveConfig cfg)
    : executor_(executor),
      tls_(std::move(tls)),
      cfg_(std::move(cfg)),
      resolver_(executor),
      ws_(executor, *tls_) {}

std::string LiveSessionClient::target() const {
    if (cfg_.api_key.empty()) return cfg_.path;
    const char sep = cfg_.path.find('?') == std::string::npos ? '?' : '&';
    return cfg_.path + sep + "key=" + cfg_.api_key;
}

void LiveSessionClient::Open(std::weak_ptr<ILiveListener> listener) {
    listener_ = std::move(listener);
    asio::co_spawn(
        executor_, [self = shared_from_this()]() -> asio::awaitable<void> { co_await self->run(); },
        asio::detached);
}

asio::awaitable<void> LiveSessionClient::run() {
    try {
        co_await connect();
    } catch (const std::exception& e) {
        if (!close_requested_) spdlog::error("[Live] Connection to {} failed: {}", cfg_.host, e.what());
        finish(e.what());
        co_return;
    }

    open_ = true;
    spdlog::info("[Live] Connected to {}{}", cfg_.host, cfg_.path);
    if (auto listener = listener_.lock()) {
        listener->OnLiveOpen();
    }

    if (close_requested_ && send_queue_.empty()) {
        do_close();
    } else if (!send_queue_.empty()) {
        do_write();
    }

    co_await read_loop();
}

asio::awaitable<void> LiveSessionClient::connect() {
    spdlog::debug("[Live] Resolving {}:{}", cfg_.host, cfg_.port);
    auto results = co_await resolver_.async_resolve(cfg_.host, cfg_.port, asio::use_awaitable);

    auto& tcp_layer = beast::get_lowest_layer(ws_);
    tcp_layer.expires_after(CONNECT_TIMEOUT);
    co_await tcp_layer.async_connect(results, asio::use_awaitable);

    // SNI, required by most TLS front ends
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), cfg_.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
            "Failed to set SNI host name");
    }
    ws_.next_layer().set_verify_mode(ssl::verify_peer);
    ws_.next_layer().set_verify_callback(ssl::host_name_verification(cfg_.host));

    tcp_layer.expires_after(CONNECT_TIMEOUT);
    co_await ws_.next_layer().async_handshake(ssl::stream_base::client, asio::use_awaitable);

    // The websocket stream runs its own timeouts from here on.
    tcp_layer.expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " voxbridge");
    }));
    ws_.read_message_max(MAX_MESSAGE_SIZE);

    co_await ws_.async_handshake(cfg_.host, target(), asio::use_awaitable);
}

asio::awaitable<void> LiveSessionClient::read_loop() {
    for (;;) {
        auto [ec, bytes] = co_await ws_.async_read(buffer_, asio::as_tuple(asio::use_awaitable));
        if (ec == websocket::error::closed) {
            const auto& why = ws_.reason();
            finish(why.reason.empty() ? std::string{"closed by peer"}
                                      : std::string(why.reason.data(), why.reason.size()));
            co_return;
        }
        if (ec) {
            if (!close_requested_) spdlog::warn("[Live] Read failed: {}", ec.message());
            finish(ec.message());
            co_return;
        }

        std::string payload = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if (auto listener = listener_.lock()) {
            listener->OnLiveMessage(payload);
        }
        if (closed_) co_return;
    }
}

void LiveSessionClient::Send(std::string message) {
    auto msg_ptr = std::make_shared<std::string>(std::move(message));
    asio::post(executor_, [self = shared_from_this(), msg_ptr]() {
        if (self->close_requested_ || self->closed_) return;
        bool writing = !self->send_queue_.empty();
        self->send_queue_.push_back(msg_ptr);
        if (!writing && self->open_) self->do_write();
    });
}

void LiveSessionClient::do_write() {
    ws_.text(true);
    ws_.async_write(asio::buffer(*send_queue_.front()),
                    beast::bind_front_handler(&LiveSessionClient::on_write, shared_from_this()));
}

void LiveSessionClient::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        spdlog::warn("[Live] Write failed: {}", ec.message());
        send_queue_.clear();
        return;
    }
    send_queue_.pop_front();
    if (!send_queue_.empty()) return do_write();
    if (close_requested_) do_close();
}

void LiveSessionClient::Close() {
    asio::post(executor_, [self = shared_from_this()]() {
        if (self->close_requested_ || self->closed_) return;
        self->close_requested_ = true;
        if (!self->open_) {
            // Still connecting: abort whatever step is in progress.
            self->resolver_.cancel();
            beast::get_lowest_layer(self->ws_).cancel();
            return;
        }
        if (self->send_queue_.empty()) self->do_close();
    });
}

void LiveSessionClient::do_close() {
    ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
        if (ec) spdlog::debug("[Live] Close: {}", ec.message());
        self->finish("closed by client");
    });
}

void LiveSessionClient::finish(const std::string& reason) {
    if (closed_) return;
    closed_ = true;
    open_ = false;
    send_queue_.clear();
    spdlog::debug("[Live] Session ended: {}", reason);
    if (auto listener = listener_.lock()) {
        listener->OnLiveClosed(reason);
    }
}

}  // namespace voxbridge
