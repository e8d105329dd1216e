/**
 * @file test_thread_pool.cpp
 * @brief Tests for the bounded worker pool
 */

#include "redeyes/utils/thread_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>

using redeyes::utils::ThreadPool;

TEST(ThreadPoolTest, RunsJobsAndReturnsResults) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.WorkerCount(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.Enqueue([i]() { return i * i; }));
    }

    int total = 0;
    for (auto& result : results) {
        total += result.get();
    }
    EXPECT_EQ(total, 2470);
}

TEST(ThreadPoolTest, ConcurrencyIsBoundedByWorkerCount) {
    ThreadPool pool(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> jobs;
    for (int i = 0; i < 8; ++i) {
        jobs.push_back(pool.Enqueue([&running, &peak]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --running;
        }));
    }
    for (auto& job : jobs) {
        job.get();
    }

    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto failing = pool.Enqueue([]() -> int { throw std::runtime_error("boom"); });
    auto fine = pool.Enqueue([]() { return 7; });

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(fine.get(), 7);
}

TEST(ThreadPoolTest, DestructorDrainsQueuedJobs) {
    std::atomic<int> completed{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 5; ++i) {
            pool.Enqueue([&completed]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                ++completed;
            });
        }
    }
    EXPECT_EQ(completed.load(), 5);
}
