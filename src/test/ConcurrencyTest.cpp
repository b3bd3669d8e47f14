#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "infrastructure/ConversionPool.hpp"
#include "infrastructure/ResultWriter.hpp"

namespace fs = std::filesystem;
using tenderlens::infrastructure::ConversionPool;
using tenderlens::infrastructure::ResultWriter;

static std::string ReadFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void TestPoolBound() {
    std::cout << "[Test] Pool never exceeds its worker count..." << std::endl;
    ConversionPool pool(3, "TestPool");
    assert(pool.size() == 3);

    const int NUM_JOBS = 40;
    std::vector<std::future<int>> futures;
    for (int i = 0; i < NUM_JOBS; ++i) {
        futures.push_back(pool.submit([i]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            return i * 2;
        }));
    }

    int sum = 0;
    for (auto& future : futures) sum += future.get();
    assert(sum == NUM_JOBS * (NUM_JOBS - 1));
    assert(pool.peakConcurrency() <= 3);
    assert(pool.peakConcurrency() >= 1);
    std::cout << "[PASS] Peak concurrency " << pool.peakConcurrency() << "." << std::endl;
}

void TestPoolErrorsAndStop() {
    std::cout << "[Test] Job exceptions and stop..." << std::endl;
    ConversionPool pool(2, "TestPool");
    auto failing = pool.submit([]() -> int { throw std::runtime_error("conversion failed"); });
    bool caught = false;
    try {
        failing.get();
    } catch (const std::runtime_error& e) {
        caught = std::string(e.what()) == "conversion failed";
    }
    assert(caught && "Job exceptions surface from get()");

    std::atomic<int> done{0};
    std::vector<std::future<void>> pending;
    for (int i = 0; i < 10; ++i) pending.push_back(pool.submit([&done]() { ++done; }));
    pool.stop();
    assert(done == 10 && "stop() drains the queue");
    pool.stop();

    bool rejected = false;
    try {
        pool.submit([]() { return 1; });
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[PASS] Errors and stop." << std::endl;
}

void TestConcurrentWrites() {
    std::cout << "[Test] Concurrent result writes..." << std::endl;
    const fs::path root = fs::temp_directory_path() / "tenderlens_concurrency_test";
    fs::remove_all(root);

    ResultWriter writer;
    const int NUM_THREADS = 8;
    const int PER_THREAD = 25;
    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&writer, &root, t]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                // Every thread rewrites the same shared file, plus its own.
                writer.writeJsonAsync((root / "shared.json").string(), nlohmann::json{{"thread", t}, {"i", i}});
                writer.writeTextAsync((root / ("tender_" + std::to_string(t) + ".txt")).string(),
                                      "tender " + std::to_string(t) + " pass " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) thread.join();
    writer.waitIdle();

    assert(writer.failureCount() == 0);
    for (int t = 0; t < NUM_THREADS; ++t) {
        const std::string content = ReadFile(root / ("tender_" + std::to_string(t) + ".txt"));
        assert(content == "tender " + std::to_string(t) + " pass " + std::to_string(PER_THREAD - 1));
    }
    auto shared = nlohmann::json::parse(ReadFile(root / "shared.json"));
    assert(shared.contains("thread") && shared["i"] == PER_THREAD - 1);

    // No temp files left behind.
    for (const auto& entry : fs::directory_iterator(root)) {
        assert(entry.path().extension() != ".tmp");
    }

    writer.stop();
    writer.writeTextAsync((root / "late.txt").string(), "ignored");
    assert(!fs::exists(root / "late.txt"));

    fs::remove_all(root);
    std::cout << "[PASS] Concurrent writes." << std::endl;
}

void TestWriteFailure() {
    std::cout << "[Test] Write failures are counted..." << std::endl;
    const fs::path root = fs::temp_directory_path() / "tenderlens_write_failure_test";
    fs::remove_all(root);
    fs::create_directories(root);
    {
        std::ofstream blocker(root / "blocker");
        blocker << "a file, not a directory";
    }

    assert(!ResultWriter::WriteAtomic((root / "blocker" / "out.json").string(), "{}"));

    ResultWriter writer;
    writer.writeTextAsync((root / "blocker" / "out.json").string(), "{}");
    writer.waitIdle();
    assert(writer.failureCount() == 1);
    writer.stop();

    fs::remove_all(root);
    std::cout << "[PASS] Write failures." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;
    TestPoolBound();
    TestPoolErrorsAndStop();
    TestConcurrentWrites();
    TestWriteFailure();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
