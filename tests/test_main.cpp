// Test main for the pvfworker suite.

#include <pvfworker/core/logger.hpp>

#include <gtest/gtest.h>

#include <cstdlib>

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    // Death tests fork while race threads may exist; re-exec instead
    GTEST_FLAG_SET(death_test_style, "threadsafe");

    const char* level = getenv("PVFWORKER_TEST_LOG_LEVEL");
    pvfworker::Logger::instance().set_level(
        pvfworker::parse_log_level(level ? level : "", pvfworker::LogLevel::WARN));
    return RUN_ALL_TESTS();
}
