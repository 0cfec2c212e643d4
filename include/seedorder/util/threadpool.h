// SEEDORDER - Thread Pool
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Fixed-size worker pool used by the parallel permutation search:
// - FIFO task queue with an upper bound
// - Futures for result retrieval; a task's exception travels through
//   its future
// - Graceful shutdown

#ifndef SEEDORDER_UTIL_THREADPOOL_H
#define SEEDORDER_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace seedorder {
namespace util {

// ============================================================================
// Thread Pool
// ============================================================================

class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{10000};  // Maximum pending tasks
        std::string name{"pool"};    // Pool name for logging
    };

    /// Create with the given number of workers (0 = hardware concurrency)
    explicit ThreadPool(size_t numThreads);

    explicit ThreadPool(const Config& config);

    /// Destructor (drops pending tasks after running ones finish)
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Block until the queue is empty and no task is executing
    void Wait();

    /// Stop the workers; tasks still queued are discarded and their
    /// futures report std::future_error (broken promise)
    void Shutdown();

    bool IsRunning() const { return running_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    size_t ActiveTasks() const { return activeTasks_.load(); }

    /// Resolve a requested worker count (0 = hardware concurrency, min 1)
    static size_t ResolveThreadCount(size_t requested);

    /**
     * Submit a task for execution.
     *
     * @return Future for the result
     * @throws std::runtime_error if the pool is shut down or the queue is full
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using ReturnType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load()) {
                throw std::runtime_error("ThreadPool '" + config_.name + "' not running");
            }
            if (tasks_.size() >= config_.maxQueueSize) {
                throw std::runtime_error("ThreadPool '" + config_.name + "' queue full");
            }
            tasks_.emplace_back([task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

private:
    Config config_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable waitCondition_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> activeTasks_{0};

    void Start();
    void WorkerLoop();
};

} // namespace util
} // namespace seedorder

#endif // SEEDORDER_UTIL_THREADPOOL_H
