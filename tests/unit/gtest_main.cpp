#include <gtest/gtest.h>
#include <iostream>

#include "config/Config.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        tt::config::LoggingConfig logging;
        logging.levels.console_log_level = spdlog::level::warn;
        logging.levels.subsystem_levels.processor = spdlog::level::err;
        logging.levels.subsystem_levels.notify = spdlog::level::critical;
        tt::log::Registry::init(logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize tokentally test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
