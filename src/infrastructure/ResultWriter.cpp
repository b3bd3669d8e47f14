/**
 * @file ResultWriter.cpp
 * @brief Implementation of ResultWriter.
 */

#include "infrastructure/ResultWriter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace tenderlens::infrastructure {

namespace fs = std::filesystem;

ResultWriter::ResultWriter() {
    m_worker = std::thread(&ResultWriter::workerLoop, this);
}

ResultWriter::~ResultWriter() {
    stop();
}

void ResultWriter::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void ResultWriter::writeTextAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[ResultWriter] Dropping write after stop: " << filename << std::endl;
            return;
        }
        m_queue.push(WriteTask{filename, content});
        ++m_inFlight;
    }
    m_cv.notify_one();
}

void ResultWriter::writeJsonAsync(const std::string& filename, const nlohmann::json& value) {
    // Invalid UTF-8 already replaced upstream; replace here too rather than throw on a worker thread.
    writeTextAsync(filename, value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

void ResultWriter::waitIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_inFlight == 0; });
}

void ResultWriter::workerLoop() {
    while (true) {
        WriteTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            if (m_queue.empty()) {
                continue;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        if (!WriteAtomic(task.filename, task.content)) {
            ++m_failures;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inFlight;
        }
        m_idleCv.notify_all();
    }
}

bool ResultWriter::WriteAtomic(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[ResultWriter] Error creating directories: " << ec.message() << std::endl;
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[ResultWriter] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[ResultWriter] Write failed: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[ResultWriter] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace tenderlens::infrastructure
