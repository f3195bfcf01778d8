#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <memory>

#include "IoContextPool.hpp"
#include "Router.hpp"
#include "Types.hpp"

namespace voxbridge {

/**
 * @brief The TCP Connection Acceptor.
 * @details
 * **Architecture: One Acceptor, Many Workers**
 * - Runs on the main io_context to accept incoming TCP connections.
 * - **Load Balancing:** each accepted socket is bound to the next worker
 *   io_context of the pool.
 * - **Handover:** the HTTP session, and the call session it may turn into, stay
 *   on that worker for their whole life.
 */
class Listener : public std::enable_shared_from_this<Listener> {
   public:
    // Opens, binds and listens. Throws boost::system::system_error on failure.
    Listener(asio::io_context& ioc, IoContextPool& pool, const tcp::endpoint& endpoint,
             const std::shared_ptr<Router>& router);

    void run();

    // Stops accepting; connections already handed over are unaffected.
    void stop();

   private:
    asio::awaitable<void> do_accept();

    tcp::acceptor acceptor_;
    IoContextPool& pool_;
    std::shared_ptr<Router> router_;
};

}  // namespace voxbridge
