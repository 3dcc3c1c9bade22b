#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace tt::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<std::chrono::milliseconds> {
    static Node encode(const std::chrono::milliseconds& rhs) {
        return Node(rhs.count());
    }

    static bool decode(const Node& node, std::chrono::milliseconds& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::chrono::milliseconds(node.as<int64_t>());
        return true;
    }
};

template<>
struct convert<CacheConfig> {
    static Node encode(const CacheConfig& rhs) {
        Node node;
        node["tick_interval_ms"] = rhs.tick_interval;
        node["min_tick_interval_ms"] = rhs.min_tick_interval;
        node["max_tick_interval_ms"] = rhs.max_tick_interval;
        node["adaptive_scheduling"] = rhs.adaptive_scheduling;
        node["queue_pressure_threshold"] = rhs.queue_pressure_threshold;
        node["idle_ticks_before_speedup"] = rhs.idle_ticks_before_speedup;
        node["ttl_file_ms"] = rhs.ttl_file;
        node["ttl_directory_ms"] = rhs.ttl_directory;
        node["sweep_interval_ms"] = rhs.sweep_interval;
        node["max_entries"] = rhs.max_entries;
        node["max_batch_per_tick"] = rhs.max_batch_per_tick;
        node["max_concurrent_jobs"] = rhs.max_concurrent_jobs;
        node["max_queue_length"] = rhs.max_queue_length;
        node["worker_threads"] = rhs.worker_threads;
        node["max_file_size_kb"] = rhs.max_file_size_bytes / 1024;
        node["sample_bytes"] = rhs.sample_bytes;
        node["debounce_window_ms"] = rhs.debounce_window;
        node["notification_batch_window_ms"] = rhs.notification_batch_window;
        node["placeholder_text"] = rhs.placeholder_text;
        node["encoding"] = rhs.encoding;
        node["enable_file_caching"] = rhs.enable_file_caching;
        node["enable_directory_caching"] = rhs.enable_directory_caching;
        node["extensions"] = rhs.extensions;
        node["ignore_patterns"] = rhs.ignore_patterns;
        return node;
    }

    static bool decode(const Node& node, CacheConfig& rhs) {
        if (!node.IsMap()) return false;
        const CacheConfig def;
        rhs.tick_interval = std::chrono::milliseconds(node["tick_interval_ms"].as<int64_t>(def.tick_interval.count()));
        rhs.min_tick_interval = std::chrono::milliseconds(node["min_tick_interval_ms"].as<int64_t>(def.min_tick_interval.count()));
        rhs.max_tick_interval = std::chrono::milliseconds(node["max_tick_interval_ms"].as<int64_t>(def.max_tick_interval.count()));
        rhs.adaptive_scheduling = node["adaptive_scheduling"].as<bool>(def.adaptive_scheduling);
        rhs.queue_pressure_threshold = node["queue_pressure_threshold"].as<std::size_t>(def.queue_pressure_threshold);
        rhs.idle_ticks_before_speedup = node["idle_ticks_before_speedup"].as<unsigned int>(def.idle_ticks_before_speedup);
        rhs.ttl_file = std::chrono::milliseconds(node["ttl_file_ms"].as<int64_t>(def.ttl_file.count()));
        rhs.ttl_directory = std::chrono::milliseconds(node["ttl_directory_ms"].as<int64_t>(def.ttl_directory.count()));
        rhs.sweep_interval = std::chrono::milliseconds(node["sweep_interval_ms"].as<int64_t>(def.sweep_interval.count()));
        rhs.max_entries = node["max_entries"].as<std::size_t>(def.max_entries);
        rhs.max_batch_per_tick = node["max_batch_per_tick"].as<std::size_t>(def.max_batch_per_tick);
        rhs.max_concurrent_jobs = node["max_concurrent_jobs"].as<std::size_t>(def.max_concurrent_jobs);
        rhs.max_queue_length = node["max_queue_length"].as<std::size_t>(def.max_queue_length);
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(def.worker_threads);
        rhs.max_file_size_bytes = node["max_file_size_kb"].as<uintmax_t>(def.max_file_size_bytes / 1024) * 1024;
        rhs.sample_bytes = node["sample_bytes"].as<std::size_t>(def.sample_bytes);
        rhs.debounce_window = std::chrono::milliseconds(node["debounce_window_ms"].as<int64_t>(def.debounce_window.count()));
        rhs.notification_batch_window = std::chrono::milliseconds(
            node["notification_batch_window_ms"].as<int64_t>(def.notification_batch_window.count()));
        rhs.placeholder_text = node["placeholder_text"].as<std::string>(def.placeholder_text);
        rhs.encoding = node["encoding"].as<std::string>(def.encoding);
        rhs.enable_file_caching = node["enable_file_caching"].as<bool>(def.enable_file_caching);
        rhs.enable_directory_caching = node["enable_directory_caching"].as<bool>(def.enable_directory_caching);
        if (node["extensions"]) rhs.extensions = node["extensions"].as<std::vector<std::string>>();
        if (node["ignore_patterns"]) rhs.ignore_patterns = node["ignore_patterns"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["tokentally"] = to_std_string(spdlog::level::to_string_view(rhs.tokentally));
        node["cache"]      = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["scheduler"]  = to_std_string(spdlog::level::to_string_view(rhs.scheduler));
        node["processor"]  = to_std_string(spdlog::level::to_string_view(rhs.processor));
        node["notify"]     = to_std_string(spdlog::level::to_string_view(rhs.notify));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tokentally = spdlog::level::from_str(node["tokentally"].as<std::string>("info"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("warn"));
        rhs.scheduler = spdlog::level::from_str(node["scheduler"].as<std::string>("warn"));
        rhs.processor = spdlog::level::from_str(node["processor"].as<std::string>("warn"));
        rhs.notify = spdlog::level::from_str(node["notify"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
