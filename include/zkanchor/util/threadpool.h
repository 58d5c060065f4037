// ZKANCHOR - Thread Pool
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Fixed-size worker pool with prioritised queueing and future-based results,
// used to hash Merkle levels in parallel. Exceptions thrown by a task are
// delivered through its future.

#ifndef ZKANCHOR_UTIL_THREADPOOL_H
#define ZKANCHOR_UTIL_THREADPOOL_H

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "zkanchor/core/errors.h"

namespace zkanchor {
namespace util {

// ============================================================================
// Task Priority
// ============================================================================

/// Queued tasks run highest priority first, FIFO within a level
enum class TaskPriority {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

const char* TaskPriorityToString(TaskPriority priority);

// ============================================================================
// Thread Pool
// ============================================================================

class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{100000}; // Maximum pending tasks
        std::string name{"pool"};
    };

    ThreadPool();
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);

    /// Drains pending tasks, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Block until the queue is empty and no task is executing
    void Wait();

    /// Finish queued tasks and join the workers; Submit fails afterwards
    void Shutdown();

    bool IsRunning() const { return running_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    const std::string& Name() const { return config_.name; }

    /// Queue a callable at Normal priority; its result or exception arrives
    /// via the future
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        return SubmitWithPriority(TaskPriority::Normal,
                                  std::forward<F>(f),
                                  std::forward<Args>(args)...);
    }

    /// Queue a callable ahead of every pending task of lower priority.
    /// Throws Error when the pool is shut down or the queue is full.
    template<typename F, typename... Args>
    auto SubmitWithPriority(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using ReturnType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<ReturnType> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (!running_.load()) {
                throw Error("pool " + config_.name + ": not running");
            }
            if (tasks_.size() >= config_.maxQueueSize) {
                throw Error("pool " + config_.name + ": queue full");
            }
            tasks_.emplace(priority, nextSequence_++, [task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

private:
    struct PrioritizedTask {
        TaskPriority priority;
        uint64_t sequence;
        std::function<void()> task;

        PrioritizedTask(TaskPriority p, uint64_t seq, std::function<void()> t)
            : priority(p), sequence(seq), task(std::move(t)) {}

        /// Ordering for std::priority_queue: higher priority first, then
        /// lower sequence number
        bool operator<(const PrioritizedTask& other) const {
            if (priority != other.priority) {
                return priority < other.priority;
            }
            return sequence > other.sequence;
        }
    };

    Config config_;
    std::vector<std::thread> workers_;
    std::priority_queue<PrioritizedTask> tasks_;
    uint64_t nextSequence_{0};

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable waitCondition_;

    std::atomic<bool> running_{false};
    size_t activeTasks_{0};

    void Start();
    void WorkerLoop();
};

// ============================================================================
// Global Thread Pool
// ============================================================================

/**
 * Process-wide pool, created on first use with hardware concurrency.
 *
 * Callers hold the returned pointer for as long as they submit to the pool.
 * InitGlobalThreadPool and ShutdownGlobalThreadPool only detach the global
 * slot; a detached pool drains and joins when its last holder releases it.
 */
std::shared_ptr<ThreadPool> GetGlobalThreadPool();

/// Replace the global pool (e.g. with a configured thread count)
void InitGlobalThreadPool(const ThreadPool::Config& config);

/// Detach the global pool; the next GetGlobalThreadPool creates a new one
void ShutdownGlobalThreadPool();

// ============================================================================
// Parallel Algorithms
// ============================================================================

/**
 * Apply func(begin, end) over [0, count) split into contiguous chunks.
 *
 * Runs inline when the range is smaller than two chunks or the pool has a
 * single worker. Otherwise every chunk is submitted, all futures are
 * waited for (a barrier), and the first task exception is rethrown.
 */
template<typename Func>
void ParallelForChunks(size_t count, size_t minChunk, Func func, ThreadPool& pool) {
    minChunk = std::max<size_t>(minChunk, 1);
    size_t workers = pool.ThreadCount();
    if (count < 2 * minChunk || workers <= 1) {
        func(size_t(0), count);
        return;
    }

    size_t chunks = std::min(workers * 4, count / minChunk);
    size_t chunkSize = (count + chunks - 1) / chunks;

    // Every task references func, so none may be outstanding when we throw
    std::vector<std::future<void>> futures;
    futures.reserve(chunks);
    try {
        for (size_t begin = 0; begin < count; begin += chunkSize) {
            size_t end = std::min(count, begin + chunkSize);
            futures.push_back(pool.Submit([&func, begin, end]() { func(begin, end); }));
        }
    } catch (...) {
        for (auto& f : futures) {
            f.wait();
        }
        throw;
    }

    for (auto& f : futures) {
        f.wait();
    }
    for (auto& f : futures) {
        f.get();
    }
}

/// Apply func(i) for each i in [begin, end) on the pool
template<typename Func>
void ParallelForIndex(size_t begin, size_t end, Func func, ThreadPool& pool) {
    if (end <= begin) return;
    ParallelForChunks(end - begin, 1,
                      [&func, begin](size_t lo, size_t hi) {
                          for (size_t i = lo; i < hi; ++i) {
                              func(begin + i);
                          }
                      },
                      pool);
}

template<typename Func>
void ParallelForIndex(size_t begin, size_t end, Func func) {
    std::shared_ptr<ThreadPool> pool = GetGlobalThreadPool();
    ParallelForIndex(begin, end, std::move(func), *pool);
}

} // namespace util
} // namespace zkanchor

#endif // ZKANCHOR_UTIL_THREADPOOL_H
