/**
 * @file worker_pool.hpp
 * @brief std::jthread worker pool for background confirmation tasks.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace lan_beacon {

/**
 * @brief Fixed-size pool of std::jthread workers.
 *
 * Tasks receive the worker's stop_token. Destroying the pool requests stop,
 * drops tasks that have not started, and joins the workers.
 */
class WorkerPool {
public:
    using Task = std::function<void(std::stop_token)>;

    explicit WorkerPool(size_t num_threads = 1);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void post(Task task);

    /// Block until the queue is empty and no task is running, or `timeout` elapses.
    bool wait_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::atomic<size_t> active_tasks_{0};
};

}  // namespace lan_beacon
