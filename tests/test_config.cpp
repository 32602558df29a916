#include <pvfworker/core/config.hpp>
#include <pvfworker/core/logger.hpp>
#include <pvfworker/core/utils.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace pvfworker;

TEST(Config, DottedKeysReachNestedValues) {
    Config config;
    ASSERT_TRUE(config.load_string(
        "{\"log_level\": \"debug\","
        " \"prepare\": {\"wall_clock_lenience\": 2.5, \"memory_sample_interval_ms\": 100},"
        " \"security\": {\"secure_validator_mode\": false}}"));

    EXPECT_EQ("debug", config.get_string("log_level", "info"));
    EXPECT_DOUBLE_EQ(2.5, config.get_double("prepare.wall_clock_lenience", 3.0));
    EXPECT_EQ(100, config.get_int("prepare.memory_sample_interval_ms", 500));
    EXPECT_FALSE(config.get_bool("security.secure_validator_mode", true));
    EXPECT_TRUE(config.has("prepare.wall_clock_lenience"));
    EXPECT_FALSE(config.has("prepare.missing"));
}

TEST(Config, MissingOrMistypedKeysFallBack) {
    Config config;
    ASSERT_TRUE(config.load_string("{\"backend\": {\"path\": 5}}"));
    EXPECT_EQ("none", config.get_string("backend.path", "none"));
    EXPECT_EQ(7, config.get_int("backend.path.deeper", 7));
    EXPECT_TRUE(config.get_bool("security.secure_validator_mode", true));
}

TEST(Config, IntegerReadsAsDouble) {
    Config config;
    ASSERT_TRUE(config.load_string("{\"prepare\": {\"wall_clock_lenience\": 4}}"));
    EXPECT_DOUBLE_EQ(4.0, config.get_double("prepare.wall_clock_lenience", 3.0));
}

TEST(Config, MalformedDocumentKeepsPreviousValues) {
    Config config;
    ASSERT_TRUE(config.load_string("{\"log_level\": \"warn\"}"));
    EXPECT_FALSE(config.load_string("{\"log_level\": "));
    EXPECT_FALSE(config.load_string("[1, 2]"));
    EXPECT_EQ("warn", config.get_string("log_level", "info"));
}

TEST(Config, SettersCreateIntermediateObjects) {
    Config config;
    config.set_string("backend.path", "/opt/backend.so");
    config.set_int("prepare.max_frame_size", 4096);
    config.set_bool("security.secure_validator_mode", false);

    EXPECT_EQ("/opt/backend.so", config.get_string("backend.path", ""));
    EXPECT_EQ(4096, config.get_int("prepare.max_frame_size", 0));
    EXPECT_FALSE(config.get_bool("security.secure_validator_mode", true));
}

TEST(Config, LoadFileMissingIsAnError) {
    pvfworker::testing_support::TempDir dir;
    Config config;
    EXPECT_FALSE(config.load_file(dir.file("nope.json")));
}

TEST(Logger, ParseLogLevel) {
    EXPECT_EQ(LogLevel::DEBUG, parse_log_level("debug", LogLevel::INFO));
    EXPECT_EQ(LogLevel::ERROR, parse_log_level("error", LogLevel::INFO));
    EXPECT_EQ(LogLevel::INFO, parse_log_level("verbose", LogLevel::INFO));
}

TEST(Utils, SplitWhitespaceDropsEmptyFields) {
    std::vector<std::string> parts = split_whitespace("  a \t b   c ");
    ASSERT_EQ(3u, parts.size());
    EXPECT_EQ("a", parts[0]);
    EXPECT_EQ("b", parts[1]);
    EXPECT_EQ("c", parts[2]);
}

TEST(Utils, Sha256OfEmptyInput) {
    EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
              sha256_hex(std::vector<uint8_t>()));
}

TEST(Utils, WriteFileOverwrites) {
    pvfworker::testing_support::TempDir dir;
    std::string path = dir.file("artifact");
    std::string error;
    ASSERT_TRUE(write_file(path, std::vector<uint8_t>(10, 1), error)) << error;
    ASSERT_TRUE(write_file(path, std::vector<uint8_t>(3, 2), error)) << error;

    FILE* f = fopen(path.c_str(), "rb");
    ASSERT_NE(nullptr, f);
    fseek(f, 0, SEEK_END);
    EXPECT_EQ(3, ftell(f));
    fclose(f);
}

TEST(Utils, WriteFileIntoMissingDirectoryFails) {
    std::string error;
    EXPECT_FALSE(write_file("/nonexistent-pvfworker-dir/artifact", std::vector<uint8_t>(1, 0), error));
    EXPECT_FALSE(error.empty());
}
