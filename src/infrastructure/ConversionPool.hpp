/**
 * @file ConversionPool.hpp
 * @brief Bounded worker pool for the expensive conversions (OCR, legacy converters).
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace tenderlens::infrastructure {

/**
 * @class ConversionPool
 * @brief Fixed set of worker threads draining one FIFO queue.
 *
 * Work is capped at @ref size() concurrent jobs no matter how many tenders
 * submit at once. Each worker thread is long-lived, so thread_local state
 * (an OCR engine, for instance) is created once per worker.
 */
class ConversionPool {
public:
    /** @param workers Thread count; 0 means std::thread::hardware_concurrency(). */
    explicit ConversionPool(std::size_t workers = 0, std::string name = "ConversionPool");
    ~ConversionPool();

    ConversionPool(const ConversionPool&) = delete;
    ConversionPool& operator=(const ConversionPool&) = delete;

    /**
     * @brief Queues a job and returns its future. Exceptions thrown by the job
     * surface from future::get().
     */
    template <typename F>
    auto submit(F&& job) -> std::future<decltype(job())> {
        using Result = decltype(job());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(job));
        std::future<Result> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                throw std::runtime_error("[" + m_name + "] submit after stop");
            }
            m_queue.push([task]() { (*task)(); });
        }
        m_cv.notify_one();
        return future;
    }

    /** @brief Drains the queue and joins the workers. Safe to call twice. */
    void stop();

    std::size_t size() const { return m_workers.size(); }

    /** @brief Highest number of jobs observed running at the same time. */
    std::size_t peakConcurrency() const { return m_peak.load(); }

private:
    void workerLoop();

    std::string m_name;
    std::queue<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<std::thread> m_workers;
    bool m_running = true;

    std::atomic<std::size_t> m_active{0};
    std::atomic<std::size_t> m_peak{0};
};

} // namespace tenderlens::infrastructure
