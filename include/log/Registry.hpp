#pragma once

#include "config/Config.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace tt::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf = {});

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> tokentally() { return get("tokentally"); }
    static std::shared_ptr<spdlog::logger> cache()      { return get("cache"); }
    static std::shared_ptr<spdlog::logger> scheduler()  { return get("scheduler"); }
    static std::shared_ptr<spdlog::logger> processor()  { return get("processor"); }
    static std::shared_ptr<spdlog::logger> notify()     { return get("notify"); }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static void initLocked(const config::LoggingConfig& cnf);

    static inline std::mutex mutex_;
    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
