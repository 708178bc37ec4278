#pragma once

/**
 * ThreadPool.hpp
 *
 * Bounded thread pool for background work that must never run on the
 * reconciliation thread (post-processing, remote cleanup).
 */

#include "Logger.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace soulsync::core {

/**
 * ThreadPool - Fixed-size FIFO thread pool
 *
 * Features:
 * - Configurable thread count
 * - Fire-and-forget tasks (post) with waitAll() for idle
 * - Graceful shutdown that drains queued work
 */
class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     * @param name Pool name used in log lines
     */
    explicit ThreadPool(size_t numThreads = 0, std::string name = "pool")
        : m_name(std::move(name)), m_stop(false), m_activeJobs(0) {

        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 4; // Fallback
        }

        m_workers.reserve(numThreads);

        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this] {
                workerLoop();
            });
        }
    }

    /**
     * Destructor - drains the queue and joins the workers
     */
    ~ThreadPool() {
        shutdown();
    }

    // Disable copy and move
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Queue a task nobody waits on. Exceptions it throws are logged.
     * @param task Function to execute
     * @throws std::runtime_error after shutdown()
     */
    void post(std::function<void()> task) {
        enqueue(std::move(task));
    }

    /**
     * Stop accepting work, finish queued tasks and join the workers
     */
    void shutdown() {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            if (m_stop) {
                return;
            }
            m_stop = true;
        }

        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    /**
     * Wait for all queued and running tasks to complete
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_idleCondition.wait(lock, [this] {
            return m_tasks.empty() && m_activeJobs == 0;
        });
    }

private:
    void enqueue(std::function<void()> task) {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);

            if (m_stop) {
                throw std::runtime_error("Cannot submit to stopped ThreadPool '" + m_name + "'");
            }

            m_tasks.emplace(std::move(task));
        }

        m_condition.notify_one();
    }

    void workerLoop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);

                m_condition.wait(lock, [this] {
                    return m_stop || !m_tasks.empty();
                });

                if (m_stop && m_tasks.empty()) {
                    return;
                }

                task = std::move(m_tasks.front());
                m_tasks.pop();
                ++m_activeJobs;
            }

            try {
                task();
            } catch (const std::exception& e) {
                Logger::instance().error("Task in pool '{}' threw: {}", m_name, e.what());
            }

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                --m_activeJobs;
                if (m_tasks.empty() && m_activeJobs == 0) {
                    m_idleCondition.notify_all();
                }
            }
        }
    }

private:
    std::string m_name;

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;

    bool m_stop;
    std::atomic<size_t> m_activeJobs;
};

} // namespace soulsync::core
