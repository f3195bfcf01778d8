#pragma once

#include <memory>
#include <boost/asio/io_context.hpp>

#include "config.hpp"

namespace voxbridge {

/**
 * @brief High-level Server Facade.
 * Builds the worker pool, the scheduling backend and tools, the call registry and
 * the HTTP front, and runs them until Stop().
 */
class Server : public std::enable_shared_from_this<Server> {
public:
    Server(boost::asio::io_context& io, AppConfig cfg);
    ~Server();

    // Blocks on the main io_context until the server stops.
    void Start();

    // Closes the listener and every call, then stops the io_contexts.
    void Stop();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace voxbridge
