#include "IoContextPool.hpp"

#include <algorithm>
#include <exception>

#include "spdlog/spdlog.h"

namespace voxbridge {

IoContextPool::IoContextPool(std::size_t workers) {
    if (workers == 0) {
        workers = std::max(1U, std::thread::hardware_concurrency());
    }
    workers_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        workers_.push_back(std::make_unique<Worker>());
    }
}

IoContextPool::~IoContextPool() { stop(); }

void IoContextPool::run() {
    if (running_) return;
    running_ = true;

    spdlog::info("Starting {} call worker(s)", workers_.size());
    for (std::size_t i = 0; i < workers_.size(); ++i) {
        Worker* worker = workers_[i].get();
        worker->thread = std::jthread([worker, i] {
            spdlog::debug("Worker {} running", i);
            try {
                worker->ioc.run();
            } catch (const std::exception& e) {
                // A handler threw past its session; the worker and its calls are gone.
                spdlog::critical("Worker {} died: {}", i, e.what());
            }
            spdlog::debug("Worker {} exited", i);
        });
    }
}

void IoContextPool::stop() {
    for (auto& worker : workers_) {
        worker->guard.reset();
        worker->ioc.stop();
    }
    for (auto& worker : workers_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
    running_ = false;
}

asio::io_context& IoContextPool::next_context() {
    const std::size_t idx = next_.fetch_add(1, std::memory_order_relaxed) % workers_.size();
    return workers_[idx]->ioc;
}

}  // namespace voxbridge
