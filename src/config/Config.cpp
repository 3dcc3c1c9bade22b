#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace tt::config {

namespace {

Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    if (const auto node = root["cache"]) {
        if (!YAML::convert<CacheConfig>::decode(node, cfg.cache))
            throw std::runtime_error("Config section 'cache' must be a mapping");
    }

    if (const auto node = root["logging"]) {
        if (!YAML::convert<LoggingConfig>::decode(node, cfg.logging))
            throw std::runtime_error("Config section 'logging' must be a mapping");
    }

    validate(cfg.cache);
    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    try {
        return decodeRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config " + path.string() + ": " + e.what());
    }
}

Config loadConfigFromString(const std::string& yaml) {
    try {
        return decodeRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["cache"] = cfg.cache;
    root["logging"] = cfg.logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

void validate(const CacheConfig& cfg) {
    using namespace std::chrono_literals;

    if (cfg.tick_interval <= 0ms) throw std::invalid_argument("cache.tick_interval must be positive");
    if (cfg.min_tick_interval <= 0ms) throw std::invalid_argument("cache.min_tick_interval must be positive");
    if (cfg.min_tick_interval > cfg.max_tick_interval)
        throw std::invalid_argument("cache.min_tick_interval must not exceed cache.max_tick_interval");
    if (cfg.ttl_file <= 0ms) throw std::invalid_argument("cache.ttl_file must be positive");
    if (cfg.ttl_directory <= 0ms) throw std::invalid_argument("cache.ttl_directory must be positive");
    if (cfg.sweep_interval <= 0ms) throw std::invalid_argument("cache.sweep_interval must be positive");
    if (cfg.debounce_window < 0ms) throw std::invalid_argument("cache.debounce_window must not be negative");
    if (cfg.notification_batch_window < 0ms)
        throw std::invalid_argument("cache.notification_batch_window must not be negative");
    if (cfg.max_batch_per_tick == 0) throw std::invalid_argument("cache.max_batch_per_tick must be at least 1");
    if (cfg.max_concurrent_jobs == 0) throw std::invalid_argument("cache.max_concurrent_jobs must be at least 1");
    if (cfg.worker_threads == 0) throw std::invalid_argument("cache.worker_threads must be at least 1");
    if (cfg.max_entries == 0) throw std::invalid_argument("cache.max_entries must be at least 1");
    if (cfg.sample_bytes == 0) throw std::invalid_argument("cache.sample_bytes must be at least 1");
    if (cfg.placeholder_text.empty()) throw std::invalid_argument("cache.placeholder_text must not be empty");
}

}
