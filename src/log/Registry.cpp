#include "log/Registry.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace tt::log {

void Registry::init(const config::LoggingConfig& cnf) {
    std::scoped_lock lock(mutex_);
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }
    initLocked(cnf);
}

void Registry::initLocked(const config::LoggingConfig& cnf) {
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (cnf.log_dir / "tokentally.log").string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("tokentally", sub_levels.tokentally);
    makeLogger("cache",      sub_levels.cache);
    makeLogger("scheduler",  sub_levels.scheduler);
    makeLogger("processor",  sub_levels.processor);
    makeLogger("notify",     sub_levels.notify);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    {
        std::scoped_lock lock(mutex_);
        if (!initialized_) initLocked({});
    }

    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[Registry] Logger not found: " + name);
    return logger;
}

}
