#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace tt::config {

constexpr static uintmax_t MAX_FILE_SIZE_BYTES = 512 * 1024;               // 512KB
constexpr static uintmax_t LARGE_ACTIVE_FILE_WARN_BYTES = 10 * 1024 * 1024; // 10MB

inline std::vector<std::string> defaultExtensions() {
    return {
        "lua", "py", "js", "ts", "java", "c", "cpp", "h", "hpp", "rs", "go", "rb", "php", "swift", "kt",
        "scala", "clj", "hs", "vim", "sh", "zsh", "fish", "ps1", "html", "css", "scss", "sass", "less",
        "vue", "svelte", "jsx", "tsx", "json", "xml", "yaml", "yml", "toml", "md", "txt", "rst", "org",
        "tex", "latex", "conf", "config", "ini", "cfg", "properties", "csv", "tsv", "sql", "graphql",
        "proto", "log", "diff", "patch"
    };
}

struct CacheConfig {
    std::chrono::milliseconds tick_interval{30000};
    std::chrono::milliseconds min_tick_interval{2000};
    std::chrono::milliseconds max_tick_interval{60000};
    bool adaptive_scheduling = true;
    std::size_t queue_pressure_threshold = 20;
    unsigned int idle_ticks_before_speedup = 3;

    std::chrono::milliseconds ttl_file{std::chrono::minutes(5)};
    std::chrono::milliseconds ttl_directory{std::chrono::minutes(10)};
    std::chrono::milliseconds sweep_interval{std::chrono::minutes(1)};
    std::size_t max_entries = 10000;

    std::size_t max_batch_per_tick = 10;
    std::size_t max_concurrent_jobs = 3;
    std::size_t max_queue_length = 50;
    unsigned int worker_threads = 2;

    uintmax_t max_file_size_bytes = MAX_FILE_SIZE_BYTES;
    std::size_t sample_bytes = 1024;

    std::chrono::milliseconds debounce_window{100};
    std::chrono::milliseconds notification_batch_window{1000};

    std::string placeholder_text = "⋯";   // U+22EF, shown while a count is pending
    std::string encoding = "cl100k_base";

    bool enable_file_caching = true;
    bool enable_directory_caching = true;

    std::vector<std::string> extensions = defaultExtensions();
    std::vector<std::string> ignore_patterns = {"*.lock", "*.tmp", "*/node_modules/*", "*/.git/*"};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum tokentally = spdlog::level::info;   // Startup, shutdown, config reloads
    spdlog::level::level_enum cache      = spdlog::level::warn;   // Sweeps, evictions, invalidations
    spdlog::level::level_enum scheduler  = spdlog::level::warn;   // Large backlogs, skipped ticks
    spdlog::level::level_enum processor  = spdlog::level::warn;   // Read failures, fallback estimates
    spdlog::level::level_enum notify     = spdlog::level::warn;   // Subscriber failures only
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;   // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    CacheConfig cache;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);
std::string dumpConfig(const Config& cfg);

// Throws std::invalid_argument naming the first offending field.
void validate(const CacheConfig& cfg);

}
