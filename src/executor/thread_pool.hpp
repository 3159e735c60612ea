/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with cooperative cancellation.
 *
 * Used by the GA for population evaluation and by the CP solver to explore
 * top-level branches concurrently. Work queued before destruction still
 * runs; workers see a stop request through their stop_token.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace uras {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts the worker's stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /**
     * @brief Run body(i) for i in [0, count), split into contiguous chunks,
     *        and block until every chunk finished.
     *
     * Rethrows the first exception raised by a chunk.
     */
    void parallel_for(size_t count, const std::function<void(size_t)>& body);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

    /// 0 means one worker per hardware thread, with a floor of one.
    [[nodiscard]] static size_t resolve_thread_count(size_t requested) noexcept;

private:
    void worker_loop(std::stop_token stop);
    void enqueue(std::function<void(std::stop_token)> job);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void(std::stop_token)>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

namespace detail {

/// Run `call` and route its value or exception into `promise`.
template <typename R, typename Call>
void fulfil(std::promise<R>& promise, Call& call) {
    try {
        if constexpr (std::is_void_v<R>) {
            call();
            promise.set_value();
        } else {
            promise.set_value(call());
        }
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace detail

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token) mutable {
        detail::fulfil(*p, f);
    });
    return future;
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token stop) mutable {
        auto bound = [&f, &stop] { return f(stop); };
        detail::fulfil(*p, bound);
    });
    return future;
}

}  // namespace uras
