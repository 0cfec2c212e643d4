// SEEDORDER - Thread Pool Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/util/threadpool.h"

namespace seedorder {
namespace util {

// ============================================================================
// ThreadPool Implementation
// ============================================================================

ThreadPool::ThreadPool(size_t numThreads) {
    config_.numThreads = numThreads;
    Start();
}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    Start();
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

size_t ThreadPool::ResolveThreadCount(size_t requested) {
    if (requested != 0) {
        return requested;
    }
    size_t hw = std::thread::hardware_concurrency();
    return hw == 0 ? 2 : hw;
}

void ThreadPool::Start() {
    if (running_.exchange(true)) {
        return;
    }

    size_t numThreads = ResolveThreadCount(config_.numThreads);
    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    waitCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_.load() == 0;
    });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }

    condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped.swap(tasks_);
    }
    waitCondition_.notify_all();
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });

            if (!running_.load()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
            activeTasks_.fetch_add(1);
        }

        // Tasks are packaged_task wrappers: a throwing task stores its
        // exception in the shared state instead of unwinding here.
        task();

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            activeTasks_.fetch_sub(1);
        }
        waitCondition_.notify_all();
    }
}

} // namespace util
} // namespace seedorder
