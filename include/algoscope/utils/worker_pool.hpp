/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool used by the serve loop
 *
 * Tasks run in submission order on up to N threads. Shutdown() (and the
 * destructor) drains the queue before joining.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace algoscope {
namespace utils {

class WorkerPool {
public:
    /// @param num_threads 0 picks std::thread::hardware_concurrency()
    explicit WorkerPool(std::size_t num_threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a callable
     * @throws std::runtime_error after Shutdown()
     */
    template <typename F>
    std::future<std::invoke_result_t<F>> Submit(F&& func);

    /// Finish queued work and join all threads
    void Shutdown();

    std::size_t ThreadCount() const { return workers_.size(); }
    std::size_t ActiveCount() const { return active_tasks_.load(); }
    std::size_t QueuedCount() const;

private:
    void WorkerLoop();
    void Enqueue(std::function<void()> task);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<std::size_t> active_tasks_{0};
    bool stopping_{false};
};

template <typename F>
std::future<std::invoke_result_t<F>> WorkerPool::Submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));
    auto future = task->get_future();
    Enqueue([task]() { (*task)(); });
    return future;
}

} // namespace utils
} // namespace algoscope
