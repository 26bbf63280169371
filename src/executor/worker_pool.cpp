/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 */

#include "executor/worker_pool.hpp"

namespace lan_beacon {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

WorkerPool::~WorkerPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    workers_.clear();  // joins
}

void WorkerPool::post(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

bool WorkerPool::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return task_queue_.empty() && active_tasks_.load() == 0;
    });
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });
            if (stop.stop_requested() || task_queue_.empty()) return;

            task = std::move(task_queue_.front());
            task_queue_.pop();
            ++active_tasks_;
        }

        task(stop);

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

size_t WorkerPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t WorkerPool::queued_count() const {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t WorkerPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace lan_beacon
