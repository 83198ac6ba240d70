#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace rc {

// Parallelism tier for automatic thread count calculation
enum class ParallelismTier {
    Auto = 0,   // 60% of cores (leaves headroom for the rest of the system)
    Fixed = 1,  // 90% of cores
    Expert = 2, // 100% of cores
};

// Calculate worker count for a tier, clamped to [1, 64]
size_t calculateThreadCount(ParallelismTier tier);

// Bounded worker pool for batch jobs.
// Workers dequeue and execute tasks concurrently until shutdown.
class ThreadPool {
  public:
    // Workers start immediately and wait for tasks
    explicit ThreadPool(size_t numThreads);

    // Shutdown pool and join all threads (executes remaining tasks)
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Enqueue a task for execution by any available worker.
    // Returns false if the pool is already shut down.
    bool enqueue(std::function<void()> task);

    // Block until the queue is empty and no task is executing
    void waitIdle();

    // Signal shutdown and wait for all workers to finish.
    // Remaining queued tasks are executed before threads exit.
    void shutdown();

    size_t threadCount() const { return m_workers.size(); }
    size_t pendingCount() const;
    size_t activeCount() const;

  private:
    void workerLoop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_taskQueue;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;

    std::atomic<size_t> m_activeCount{0};
    std::atomic<bool> m_shutdown{false};
};

} // namespace rc
