#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "Types.hpp"

namespace voxbridge {

/**
 * @brief Worker threads for call traffic, one single-threaded io_context each.
 * @details
 * Every accepted connection is placed on one worker (round-robin) and everything
 * its call does afterwards, the AI connection and tool calls included, runs on
 * that worker. A call therefore never needs locking, and a slow call only delays
 * the calls sharing its worker.
 */
class IoContextPool {
   public:
    // workers 0 = one per hardware thread
    explicit IoContextPool(std::size_t workers);
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    // Starts one thread per worker. Calling it twice is a no-op.
    void run();

    // Stops every worker and joins the threads. Pending handlers are abandoned.
    void stop();

    // Worker for the next connection.
    asio::io_context& next_context();

    std::size_t size() const noexcept { return workers_.size(); }

   private:
    struct Worker {
        Worker() : guard(asio::make_work_guard(ioc)) {}

        asio::io_context ioc{1};
        asio::executor_work_guard<asio::io_context::executor_type> guard;
        std::jthread thread;
    };

    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<std::size_t> next_{0};
    bool running_ = false;
};

}  // namespace voxbridge
