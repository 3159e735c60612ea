/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

#include <algorithm>

namespace uras {

size_t ThreadPool::resolve_thread_count(size_t requested) noexcept {
    if (requested > 0) return requested;
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

ThreadPool::ThreadPool(size_t num_threads) {
    const size_t count = resolve_thread_count(num_threads);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) worker.request_stop();
    queue_cv_.notify_all();
    // jthread joins on destruction; workers drain the queue first.
}

void ThreadPool::enqueue(std::function<void(std::stop_token)> job) {
    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
}

void ThreadPool::worker_loop(std::stop_token stop) {
    for (;;) {
        std::function<void(std::stop_token)> job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });
            if (task_queue_.empty()) return;   // stop requested and nothing left
            job = std::move(task_queue_.front());
            task_queue_.pop();
        }

        active_tasks_.fetch_add(1, std::memory_order_relaxed);
        job(stop);
        active_tasks_.fetch_sub(1, std::memory_order_relaxed);
    }
}

void ThreadPool::parallel_for(size_t count, const std::function<void(size_t)>& body) {
    if (count == 0) return;

    const size_t chunks = std::min(count, thread_count());
    const size_t chunk_size = (count + chunks - 1) / chunks;

    std::vector<std::future<void>> pending;
    pending.reserve(chunks);
    for (size_t begin = 0; begin < count; begin += chunk_size) {
        const size_t end = std::min(count, begin + chunk_size);
        pending.push_back(submit([&body, begin, end] {
            for (size_t i = begin; i < end; ++i) body(i);
        }));
    }

    // Wait for every chunk before rethrowing so no chunk outlives `body`.
    std::exception_ptr first_error;
    for (auto& chunk : pending) {
        try {
            chunk.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace uras
