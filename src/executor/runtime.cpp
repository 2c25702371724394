/**
 * @file runtime.cpp
 * @brief Runtime implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/runtime.hpp"

#include <algorithm>
#include <string>

namespace lan_discovery {

Runtime::Runtime(size_t num_threads, std::shared_ptr<Logger> logger)
    : work_guard_(boost::asio::make_work_guard(io_))
    , logger_(logger ? std::move(logger) : make_null_logger()) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
    }
    num_threads = std::max(num_threads, MIN_RUNTIME_THREADS);

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

Runtime::~Runtime() {
    shutdown();
}

void Runtime::shutdown() {
    io_.stop();
    work_guard_.reset();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.request_stop();
            worker.join();
        }
    }
}

void Runtime::worker_loop(std::stop_token stop) {
    // A throwing handler unwinds out of run(); log it and resume the loop
    while (!stop.stop_requested() && !io_.stopped()) {
        try {
            io_.run();
        } catch (const std::exception& e) {
            logger_->error(std::string("Runtime handler threw: ") + e.what());
        }
    }
}

size_t Runtime::thread_count() const noexcept {
    return workers_.size();
}

bool Runtime::running_in_this_thread() noexcept {
    return io_.get_executor().running_in_this_thread();
}

}  // namespace lan_discovery
