#include "HttpSession.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <utility>

namespace voxbridge {

namespace {

// Webhooks and upgrade requests are tiny.
constexpr uint64_t REQUEST_BODY_LIMIT = 64 * 1024;
constexpr auto IDLE_TIMEOUT = std::chrono::seconds(15);
constexpr auto LINGER_TIMEOUT = std::chrono::seconds(1);

// Errors that just mean the peer left.
bool is_disconnect(const beast::error_code& ec) {
    return ec == http::error::end_of_stream || ec == asio::error::eof ||
           ec == asio::error::connection_reset || ec == beast::errc::not_connected ||
           ec == beast::error::timeout;
}

}  // namespace

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<Router> router)
    : stream_(std::move(socket)), router_(std::move(router)) {
    beast::error_code ec;
    const auto remote = stream_.socket().remote_endpoint(ec);
    peer_ = ec ? std::string{"?"} : remote.address().to_string() + ":" + std::to_string(remote.port());
}

void HttpSession::run() {
    asio::co_spawn(
        stream_.get_executor(), [self = shared_from_this()]() { return self->serve(); },
        asio::detached);
}

asio::awaitable<void> HttpSession::serve() {
    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(REQUEST_BODY_LIMIT);
        stream_.expires_after(IDLE_TIMEOUT);

        auto [ec, _] = co_await http::async_read(stream_, buffer_, parser, asio::as_tuple(asio::use_awaitable));
        if (ec) {
            if (is_disconnect(ec)) {
                spdlog::trace("[{}] HTTP peer closed: {}", peer_, ec.message());
            } else {
                spdlog::warn("[{}] Bad HTTP request: {}", peer_, ec.message());
            }
            co_await close_gracefully();
            co_return;
        }

        req_t req = parser.release();
        spdlog::debug("[{}] {} {}", peer_, std::string(req.method_string()), std::string(req.target()));

        if (beast::websocket::is_upgrade(req)) {
            if (co_await hand_over(req)) co_return;
            co_await close_gracefully();
            co_return;
        }

        res_t res;
        res.version(req.version());
        res.keep_alive(req.keep_alive());
        if (req.method() == http::verb::options) {
            ResponseBuilder::build_options_response(res, req.version(), req.keep_alive());
        } else {
            router_->RouteQuery(req, res, stream_);
        }

        if (!co_await send(res) || !res.keep_alive()) {
            co_await close_gracefully();
            co_return;
        }
    }
}

asio::awaitable<bool> HttpSession::hand_over(const req_t& req) {
    // A media stream lives for the whole call.
    stream_.expires_never();

    res_t res;
    router_->RouteQuery(req, res, stream_);
    if (!stream_.socket().is_open()) {
        spdlog::info("[{}] Media stream handed to call session", peer_);
        co_return true;
    }

    // Refused (wrong path, bad request): answer and hang up.
    res.keep_alive(false);
    co_await send(res);
    co_return false;
}

asio::awaitable<bool> HttpSession::send(res_t& res) {
    res.prepare_payload();

    beast::error_code opt_ec;
    stream_.socket().set_option(tcp::no_delay(true), opt_ec);

    auto [ec, bytes] = co_await http::async_write(stream_, res, asio::as_tuple(asio::use_awaitable));
    if (ec) {
        if (!is_disconnect(ec)) {
            spdlog::error("[{}] HTTP write failed: {}", peer_, ec.message());
        }
        co_return false;
    }
    spdlog::trace("[{}] {} ({} bytes)", peer_, res.result_int(), bytes);
    co_return true;
}

asio::awaitable<void> HttpSession::close_gracefully() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);

    // Give the peer a moment to read the response before the socket goes.
    char sink[512];
    stream_.expires_after(LINGER_TIMEOUT);
    co_await stream_.async_read_some(asio::buffer(sink), asio::as_tuple(asio::use_awaitable));

    stream_.socket().close(ec);
}

}  // namespace voxbridge
