/**
 * @file runtime.hpp
 * @brief Multi-worker asio execution context shared by discovery engines.
 * @author Dimitris Kafetzis
 *
 * Workers are std::jthreads running io_context::run(). Discovery loops are
 * chains of asynchronous operations, so a timer wait or socket receive
 * parks the operation, not the worker.
 */

#pragma once

#include "core/logger.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <concepts>
#include <exception>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

namespace lan_discovery {

inline constexpr size_t MIN_RUNTIME_THREADS = 2;

class Runtime {
public:
    explicit Runtime(size_t num_threads = 0, std::shared_ptr<Logger> logger = nullptr);
    ~Runtime();

    // Non-copyable, non-movable
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    [[nodiscard]] boost::asio::io_context& context() noexcept { return io_; }

    /**
     * @brief Run `func` on a worker; the future completes with its result.
     *
     * Blocking on the future from a worker thread can deadlock a saturated
     * runtime; foreign threads are the intended callers.
     */
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Stop the context, drop the work guard and join every worker.
    void shutdown();

    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] bool running_in_this_thread() noexcept;

private:
    void worker_loop(std::stop_token stop);

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::shared_ptr<Logger> logger_;
    std::vector<std::jthread> workers_;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> Runtime::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    boost::asio::post(io_, [p = std::move(promise), f = std::forward<F>(func)]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

}  // namespace lan_discovery
