#include "Listener.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "HttpSession.hpp"
#include "spdlog/spdlog.h"

namespace voxbridge {

namespace {

void fail(beast::error_code ec, const char* what) {
    if (ec != beast::errc::not_connected && ec != asio::error::eof &&
        ec != asio::error::connection_reset) {
        spdlog::error("{} : {}", what, ec.message());
    }
}

}  // namespace

Listener::Listener(asio::io_context& main_ioc, IoContextPool& pool, const tcp::endpoint& endpoint,
                   const std::shared_ptr<Router>& router)
    : acceptor_(main_ioc), pool_(pool), router_(router) {
    acceptor_.open(endpoint.protocol());

    // SO_REUSEADDR: quick restarts without "Address already in use" from TIME_WAIT.
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);

    spdlog::debug("Listener bound to {}:{}", endpoint.address().to_string(), endpoint.port());
}

void Listener::run() {
    spdlog::debug("Starting to accept connections...");
    asio::co_spawn(
        acceptor_.get_executor(), [self = shared_from_this()]() { return self->do_accept(); },
        asio::detached);
}

void Listener::stop() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) fail(ec, "acceptor close");
    });
}

asio::awaitable<void> Listener::do_accept() {
    for (;;) {
        // The new socket is created directly on a worker io_context.
        auto& worker = pool_.next_context();

        auto [ec, socket] = co_await acceptor_.async_accept(worker, asio::as_tuple(asio::use_awaitable));

        if (ec) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                spdlog::debug("Listener stopped");
                co_return;
            }
            fail(ec, "accept");
            continue;
        }

        std::make_shared<HttpSession>(std::move(socket), router_)->run();
    }
}

}  // namespace voxbridge
