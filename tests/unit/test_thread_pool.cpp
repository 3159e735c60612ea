/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <numeric>
#include <stdexcept>

using namespace uras;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, CancellableSeesStopToken) {
    ThreadPool pool(1);
    auto future = pool.submit_cancellable([](std::stop_token stop) { return stop.stop_possible(); });
    EXPECT_TRUE(future.get());
}

TEST(ThreadPoolTest, ParallelForVisitsEveryIndexOnce) {
    ThreadPool pool(4);
    std::vector<int> hits(1'001, 0);
    pool.parallel_for(hits.size(), [&hits](size_t i) { hits[i] += 1; });
    EXPECT_EQ(std::accumulate(hits.begin(), hits.end(), 0), 1'001);
    for (int h : hits) EXPECT_EQ(h, 1);
}

TEST(ThreadPoolTest, ParallelForFewerItemsThanThreads) {
    ThreadPool pool(8);
    std::atomic<int> sum{0};
    pool.parallel_for(3, [&sum](size_t i) { sum += static_cast<int>(i) + 1; });
    EXPECT_EQ(sum.load(), 6);
    pool.parallel_for(0, [&sum](size_t) { sum += 100; });
    EXPECT_EQ(sum.load(), 6);
}

TEST(ThreadPoolTest, ParallelForRethrows) {
    ThreadPool pool(2);
    EXPECT_THROW(pool.parallel_for(10, [](size_t i) {
        if (i == 7) throw std::out_of_range("seven");
    }), std::out_of_range);
}

TEST(ThreadPoolTest, ShutdownWithQueuedWorkReturns) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 20; ++i) {
            (void)pool.submit([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                done.fetch_add(1);
            });
        }
    }
    EXPECT_LE(done.load(), 20);
}
