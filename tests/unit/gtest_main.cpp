#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        mg::config::Config cfg;
        const auto root = fs::temp_directory_path() / "mediagate-tests";
        cfg.cache.directory = root / "cache";
        cfg.transfer.staging_directory = root / "staging";
        cfg.credentials.store_path.clear();
        cfg.logging.log_dir = root / "log";

        mg::config::ConfigRegistry::initWith(cfg);
        mg::log::Registry::initForTesting();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize mediagate test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
