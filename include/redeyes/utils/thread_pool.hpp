/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool returning futures
 *
 * Bounds how many command batches run at once inside a campaign phase. Jobs
 * are executed in FIFO order by a fixed set of workers; the caller awaits the
 * returned std::future.
 *
 * @date 2025
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace redeyes {
namespace utils {

/**
 * @class ThreadPool
 * @brief Fixed number of worker threads draining a FIFO job queue
 *
 * Exceptions thrown by a job are stored in its future and rethrown by
 * future::get() on the awaiting thread.
 *
 * **Usage Example**:
 * @code
 * ThreadPool pool(5);
 * auto future = pool.Enqueue([]() { return 42; });
 * int value = future.get();
 * @endcode
 */
class ThreadPool {
public:
    /**
     * @brief Start worker threads
     * @param worker_count Number of workers (must be > 0)
     * @throws std::invalid_argument if worker_count is zero
     */
    explicit ThreadPool(std::size_t worker_count);

    /// Drains remaining jobs, then joins all workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Submit a job
     * @return Future for the job's result
     * @throws std::runtime_error if the pool is shutting down
     */
    template <typename F>
    auto Enqueue(F&& job) -> std::future<std::invoke_result_t<F>> {
        using Result = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(job));
        std::future<Result> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("ThreadPool is shutting down");
            }
            jobs_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    std::size_t WorkerCount() const { return workers_.size(); }

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
};

} // namespace utils
} // namespace redeyes
