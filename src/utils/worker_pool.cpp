/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation
 *
 * @date 2025
 */

#include "algoscope/utils/worker_pool.hpp"

#include <stdexcept>

namespace algoscope {
namespace utils {

// Constructor
WorkerPool::WorkerPool(std::size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4;
        }
    }

    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { WorkerLoop(); });
    }
}

// Destructor
WorkerPool::~WorkerPool() {
    Shutdown();
}

void WorkerPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

std::size_t WorkerPool::QueuedCount() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void WorkerPool::Enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            throw std::runtime_error("WorkerPool is shut down");
        }
        tasks_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

void WorkerPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });

            if (tasks_.empty()) {
                return;  // stopping and drained
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        ++active_tasks_;
        task();
        --active_tasks_;
    }
}

} // namespace utils
} // namespace algoscope
