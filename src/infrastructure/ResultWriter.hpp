/**
 * @file ResultWriter.hpp
 * @brief Serialized, atomic writer for per-tender result files.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <nlohmann/json_fwd.hpp>

namespace tenderlens::infrastructure {

/**
 * @struct WriteTask
 * @brief A single file write operation.
 */
struct WriteTask {
    std::string filename;
    std::string content;
};

/**
 * @class ResultWriter
 * @brief Background thread that performs atomic file writes sequentially.
 *
 * Tender workers finish in any order; every result file passes through this
 * one queue so no two writers ever touch the same path at once.
 */
class ResultWriter {
public:
    ResultWriter();
    ~ResultWriter();

    ResultWriter(const ResultWriter&) = delete;
    ResultWriter& operator=(const ResultWriter&) = delete;

    /** @brief Queues @p content for @p filename. Ignored after stop(). */
    void writeTextAsync(const std::string& filename, const std::string& content);

    /** @brief Queues @p value pretty-printed with a 2-space indent. */
    void writeJsonAsync(const std::string& filename, const nlohmann::json& value);

    /** @brief Blocks until every queued write has been performed. */
    void waitIdle();

    /** @brief Drains the queue and joins the worker thread. */
    void stop();

    /** @brief Number of writes that failed so far. */
    std::size_t failureCount() const { return m_failures.load(); }

    /**
     * @brief Writes @p content to @p filename via temp file + rename.
     * @return false on failure (already reported on stderr).
     */
    static bool WriteAtomic(const std::string& filename, const std::string& content);

private:
    void workerLoop();

    std::queue<WriteTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::size_t m_inFlight = 0;

    std::thread m_worker;
    bool m_running = true;
    std::atomic<std::size_t> m_failures{0};
};

} // namespace tenderlens::infrastructure
