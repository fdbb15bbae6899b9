#pragma once

/// @file thread_pool.h
/// @brief SkyRCA thread pool for fanning per-service work out across workers

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace skyrca {

/// @brief A simple thread pool for executing tasks in parallel
class ThreadPool {
public:
    /// @brief Create a thread pool with the specified number of threads
    /// @param num_threads Number of worker threads (default: hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    /// @brief Destructor - drains queued tasks and joins workers
    ~ThreadPool();

    // Non-copyable and non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Submit a task for execution
    /// @return Future containing the result
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    /// @brief Get the number of worker threads
    size_t Size() const { return workers_.size(); }

    /// @brief Get the number of queued plus running tasks
    size_t PendingTasks() const;

    /// @brief Wait for all submitted tasks to complete
    void Wait();

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_tasks_{0};
};

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load(std::memory_order_acquire)) {
            throw std::runtime_error("Cannot submit task to stopped thread pool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

/// @brief Apply @p fn to every index in [0, count) and collect results in index order
///
/// Runs inline when @p num_threads <= 1. Result order never depends on
/// scheduling, so callers get identical output from serial and parallel runs.
template <typename Fn>
auto ParallelMap(size_t count, size_t num_threads, Fn&& fn)
    -> std::vector<std::invoke_result_t<Fn, size_t>> {
    using result_type = std::invoke_result_t<Fn, size_t>;

    std::vector<result_type> results;
    results.reserve(count);

    if (num_threads <= 1 || count <= 1) {
        for (size_t i = 0; i < count; ++i) {
            results.push_back(fn(i));
        }
        return results;
    }

    ThreadPool pool(std::min(num_threads, count));
    std::vector<std::future<result_type>> futures;
    futures.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        futures.push_back(pool.Submit([&fn, i]() { return fn(i); }));
    }
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

}  // namespace skyrca
