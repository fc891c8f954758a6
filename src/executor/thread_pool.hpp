/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with cooperative cancellation.
 *
 * Runs execution attempts, health probes, and API connections. Tasks queued
 * before shutdown() are drained rather than dropped, so an attempt that holds
 * a sandbox instance always gets to release it.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 */
class ThreadPool {
public:
    /// Called with the message of an exception escaping a post()ed task.
    using ErrorHandler = std::function<void(const std::string&)>;

    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts a stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /**
     * @brief Fire-and-forget submission.
     * @return false if the pool is shutting down and the task was not queued.
     */
    template <std::invocable F>
    bool post(F&& func);

    void set_error_handler(ErrorHandler handler);

    /// Block until the queue is empty and no task is running.
    void wait_idle();

    /// Refuse new work, drain queued tasks, and join the workers. Idempotent.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] uint64_t failed_count() const noexcept;

private:
    bool enqueue(std::function<void(std::stop_token)> task);
    void worker_loop(std::stop_token stop);
    void report_failure(const std::string& message);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void(std::stop_token)>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable idle_cv_;
    std::atomic<size_t> active_tasks_{0};
    std::atomic<uint64_t> failed_tasks_{0};
    bool accepting_ = true;
    ErrorHandler error_handler_;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool queued = enqueue([p = promise, f = std::forward<F>(func)](std::stop_token) mutable {
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
    if (!queued) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("ThreadPool is shut down")));
    }
    return future;
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool queued = enqueue([p = promise, f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    if (!queued) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("ThreadPool is shut down")));
    }
    return future;
}

template <std::invocable F>
bool ThreadPool::post(F&& func) {
    return enqueue([this, f = std::forward<F>(func)](std::stop_token) mutable {
        try {
            f();
        } catch (const std::exception& e) {
            report_failure(e.what());
        } catch (...) {
            report_failure("non-standard exception");
        }
    });
}

}  // namespace sandbox_orchestrator
