/**
 * @file ClassificationPool.hpp
 * @brief Fixed-size worker pool for external classifier calls.
 */

#pragma once
#include <algorithm>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sortwell::application {

/**
 * @class ClassificationPool
 * @brief Runs queued jobs on at most workerCount threads.
 *
 * Jobs must be independent of one another; the pool gives no ordering guarantee.
 * drain() blocks until every submitted job has run and the workers have exited.
 */
class ClassificationPool {
public:
    explicit ClassificationPool(int workerCount) : m_running(true) {
        int count = std::max(1, workerCount);
        for (int i = 0; i < count; ++i) {
            m_workers.emplace_back(&ClassificationPool::workerLoop, this);
        }
    }

    ~ClassificationPool() {
        drain();
    }

    ClassificationPool(const ClassificationPool&) = delete;
    ClassificationPool& operator=(const ClassificationPool&) = delete;

    void submit(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_queue.push(std::move(job));
        }
        m_cv.notify_one();
    }

    void drain() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) return;
            m_running = false;
        }
        m_cv.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
    }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> job;

            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this] {
                    return !m_queue.empty() || !m_running;
                });

                if (!m_running && m_queue.empty()) {
                    return;
                }

                job = std::move(m_queue.front());
                m_queue.pop();
            }

            // Jobs handle their own failures; anything escaping is logged here.
            try {
                job();
            } catch (const std::exception& e) {
                std::cerr << "[ClassificationPool] Job failed: " << e.what() << std::endl;
            }
        }
    }

    std::queue<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    std::vector<std::thread> m_workers;
    bool m_running;
};

} // namespace sortwell::application
