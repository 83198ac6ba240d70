#include "thread_pool.h"

#include <algorithm>
#include <exception>

#include "../utils/log.h"

namespace rc {

size_t calculateThreadCount(ParallelismTier tier) {
    unsigned int cores = std::thread::hardware_concurrency();
    if (cores == 0) {
        cores = 4; // Fallback if detection fails
    }

    size_t threadCount = 0;
    switch (tier) {
    case ParallelismTier::Auto:
        threadCount = static_cast<size_t>(cores * 0.6);
        break;
    case ParallelismTier::Fixed:
        threadCount = static_cast<size_t>(cores * 0.9);
        break;
    case ParallelismTier::Expert:
        threadCount = cores;
        break;
    }

    threadCount = std::max(size_t(1), std::min(size_t(64), threadCount));
    return threadCount;
}

ThreadPool::ThreadPool(size_t numThreads) {
    numThreads = std::max(size_t(1), numThreads);
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        m_workers.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown.load()) {
            return false;
        }
        m_taskQueue.push(std::move(task));
    }
    m_condition.notify_one();
    return true;
}

void ThreadPool::waitIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCondition.wait(lock,
                         [this] { return m_taskQueue.empty() && m_activeCount.load() == 0; });
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown.exchange(true)) {
            return; // Already shut down
        }
    }

    m_condition.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t ThreadPool::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_taskQueue.size();
}

size_t ThreadPool::activeCount() const {
    return m_activeCount.load();
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, [this] { return m_shutdown.load() || !m_taskQueue.empty(); });

            if (m_shutdown.load() && m_taskQueue.empty()) {
                return;
            }

            task = std::move(m_taskQueue.front());
            m_taskQueue.pop();
            m_activeCount.fetch_add(1);
        }

        // Execute outside the lock. A throwing task must not take the worker down.
        try {
            task();
        } catch (const std::exception& e) {
            log::errorf("ThreadPool", "Task threw: %s", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_activeCount.fetch_sub(1);
        }
        m_idleCondition.notify_all();
    }
}

} // namespace rc
