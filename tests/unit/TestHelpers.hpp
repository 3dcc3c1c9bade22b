#pragma once

#include "config/Config.hpp"
#include "counting/Counter.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

namespace tt::test {

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("tokentally_test_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }

    std::string write(const std::string& relative, const std::string& content) const {
        const auto p = path_ / relative;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }

    std::string mkdir(const std::string& relative) const {
        const auto p = path_ / relative;
        fs::create_directories(p);
        return p.string();
    }

private:
    fs::path path_;
};

// Counts bytes, so a file's value is its size. Records every call.
class ScriptedCounter final : public counting::Counter {
public:
    uint64_t count(const std::string_view content, const std::string&) override {
        ++calls;
        if (gate) gate->wait();
        if (fail.load()) throw std::runtime_error("counter unavailable");
        return content.size();
    }

    [[nodiscard]] std::string name() const override { return "scripted"; }

    std::atomic<int> calls{0};
    std::atomic<bool> fail{false};
    std::optional<std::shared_future<void>> gate;   // set before the first call
};

// Windows and intervals short enough for tests driven by explicit time points.
inline config::CacheConfig testConfig() {
    config::CacheConfig cfg;
    cfg.tick_interval = std::chrono::milliseconds(1000);
    cfg.min_tick_interval = std::chrono::milliseconds(100);
    cfg.max_tick_interval = std::chrono::milliseconds(8000);
    cfg.debounce_window = std::chrono::milliseconds(100);
    cfg.notification_batch_window = std::chrono::milliseconds(200);
    cfg.max_batch_per_tick = 10;
    cfg.max_concurrent_jobs = 3;
    cfg.max_queue_length = 50;
    cfg.worker_threads = 2;
    cfg.ignore_patterns = {"*.lock", "*.tmp", "*/node_modules/*", "*/.git/*"};
    return cfg;
}

inline std::string repeat(const std::size_t n, const char c = 'x') {
    return std::string(n, c);
}

inline bool waitFor(const std::function<bool()>& pred,
                    const std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}
