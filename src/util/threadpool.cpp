// ZKANCHOR - Thread Pool Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/util/threadpool.h"

#include "zkanchor/util/logging.h"

namespace zkanchor {
namespace util {

const char* TaskPriorityToString(TaskPriority priority) {
    switch (priority) {
        case TaskPriority::Low: return "low";
        case TaskPriority::Normal: return "normal";
        case TaskPriority::High: return "high";
        case TaskPriority::Critical: return "critical";
        default: return "unknown";
    }
}

// ============================================================================
// ThreadPool Implementation
// ============================================================================

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

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

void ThreadPool::Start() {
    running_.store(true);

    size_t numThreads = config_.numThreads;
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 2;
        }
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }

    LOG_DEBUG(LogCategory::POOL) << "Started pool '" << config_.name
                                 << "' with " << numThreads << " workers";
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    waitCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
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
}

size_t ThreadPool::PendingTasks() const {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

void ThreadPool::WorkerLoop() {
    for (;;) {
        PrioritizedTask task(TaskPriority::Normal, 0, nullptr);

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });

            // Queued work is drained before the worker exits
            if (tasks_.empty()) {
                return;
            }

            // top() is const; the element is popped immediately after
            task = std::move(const_cast<PrioritizedTask&>(tasks_.top()));
            tasks_.pop();
            ++activeTasks_;
        }

        // Tasks are packaged_task wrappers; they capture their own exceptions
        task.task();

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            --activeTasks_;
        }
        waitCondition_.notify_all();
    }
}

// ============================================================================
// Global Thread Pool
// ============================================================================

namespace {
    std::shared_ptr<ThreadPool> g_globalPool;
    std::mutex g_globalPoolMutex;
}

std::shared_ptr<ThreadPool> GetGlobalThreadPool() {
    std::lock_guard<std::mutex> lock(g_globalPoolMutex);
    if (!g_globalPool) {
        ThreadPool::Config config;
        config.name = "global";
        g_globalPool = std::make_shared<ThreadPool>(config);
    }
    return g_globalPool;
}

void InitGlobalThreadPool(const ThreadPool::Config& config) {
    std::shared_ptr<ThreadPool> replacement = std::make_shared<ThreadPool>(config);
    std::shared_ptr<ThreadPool> previous;
    {
        std::lock_guard<std::mutex> lock(g_globalPoolMutex);
        previous = std::move(g_globalPool);
        g_globalPool = std::move(replacement);
    }
    // previous joins here unless a caller still holds it
}

void ShutdownGlobalThreadPool() {
    std::shared_ptr<ThreadPool> previous;
    {
        std::lock_guard<std::mutex> lock(g_globalPoolMutex);
        previous = std::move(g_globalPool);
    }
}

} // namespace util
} // namespace zkanchor
