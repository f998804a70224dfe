#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "TestEnv.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        const auto logDir = fs::temp_directory_path() / "sitemigrate-tests" / "log";
        fs::create_directories(logDir);

        auto cfg = sm::test::testConfig(fs::temp_directory_path() / "sitemigrate-tests");
        cfg.logging.levels.console_log_level = spdlog::level::err;
        sm::config::ConfigRegistry::init(cfg);
        sm::logging::LogRegistry::init(logDir);

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize sitemigrate test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
