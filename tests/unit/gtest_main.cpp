#include <gtest/gtest.h>
#include <iostream>

#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        mg::logging::LogRegistry::init({.console_level = spdlog::level::warn});
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize mirrorguard test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
