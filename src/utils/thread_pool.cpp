/**
 * @file thread_pool.cpp
 * @brief Worker loop and lifecycle of the fixed-size thread pool
 *
 * @date 2025
 */

#include "redeyes/utils/thread_pool.hpp"

#include <spdlog/spdlog.h>

namespace redeyes {
namespace utils {

ThreadPool::ThreadPool(std::size_t worker_count) {
    if (worker_count == 0) {
        throw std::invalid_argument("ThreadPool requires at least one worker");
    }

    workers_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { WorkerLoop(); });
    }

    spdlog::debug("Thread pool started with {} workers", worker_count);
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (stopping_ && jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        // packaged_task captures job exceptions into the future
        job();
    }
}

} // namespace utils
} // namespace redeyes
