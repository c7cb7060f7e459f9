#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>

#include "logging/logger.hpp"

int main(int argc, char **argv) {
    // Explicitly initialize GoogleTest so --gtest_list_tests and filters work
    // reliably during CTest discovery.
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    // Cache and runner logs are noise in test output unless asked for
    const char *level = std::getenv("ENVKEEPER_TEST_LOG_LEVEL");
    envkeeper::logging::Logger::init(envkeeper::logging::string_to_level(level != nullptr ? level : "error"));

    return RUN_ALL_TESTS();
}
