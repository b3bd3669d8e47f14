/**
 * @file ConversionPool.cpp
 * @brief Implementation of ConversionPool.
 */

#include "infrastructure/ConversionPool.hpp"
#include <iostream>

namespace tenderlens::infrastructure {

ConversionPool::ConversionPool(std::size_t workers, std::string name) : m_name(std::move(name)) {
    if (workers == 0) {
        workers = std::thread::hardware_concurrency();
        if (workers == 0) workers = 2;
    }
    m_workers.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        m_workers.emplace_back(&ConversionPool::workerLoop, this);
    }
    std::cout << "[" << m_name << "] Started " << workers << " worker(s)" << std::endl;
}

ConversionPool::~ConversionPool() {
    stop();
}

void ConversionPool::stop() {
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

void ConversionPool::workerLoop() {
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

        const std::size_t active = ++m_active;
        std::size_t peak = m_peak.load();
        while (active > peak && !m_peak.compare_exchange_weak(peak, active)) {}

        // packaged_task stores any exception in the future.
        job();
        --m_active;
    }
}

} // namespace tenderlens::infrastructure
