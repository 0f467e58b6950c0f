/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace tree_scheduler;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ts_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.scheduler.processors, 0u);
    EXPECT_EQ(config.scheduler.mode, RunMode::Compare);
    EXPECT_EQ(config.telemetry.log_level, "info");
    EXPECT_TRUE(config.telemetry.log_dir.empty());
    EXPECT_TRUE(config.telemetry.report_dir.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [scheduler]
        processors = 4
        mode = "ascending"

        [telemetry]
        log_dir = "/tmp/ts_logs"
        log_level = "debug"
        max_file_size_mb = 10
        rotate_count = 2
        report_dir = "/tmp/ts_reports"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.scheduler.processors, 4u);
    EXPECT_EQ(config.scheduler.mode, RunMode::Single);
    EXPECT_EQ(config.scheduler.policy, SchedulingPolicy::Ascending);
    EXPECT_EQ(config.telemetry.log_dir, "/tmp/ts_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.max_file_size_mb, 10u);
    EXPECT_EQ(config.telemetry.rotate_count, 2u);
    EXPECT_EQ(config.telemetry.report_dir, "/tmp/ts_reports");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [scheduler]
        processors = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->scheduler.processors, 2u);
    // Defaults for everything else
    EXPECT_EQ(result->scheduler.mode, RunMode::Compare);
    EXPECT_EQ(result->telemetry.log_level, "info");
}

TEST_F(ConfigTest, UnknownModeRejected) {
    auto path = write_toml(R"(
        [scheduler]
        mode = "fastest"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidConfiguration);
}

TEST_F(ConfigTest, NegativeProcessorsRejected) {
    auto path = write_toml(R"(
        [scheduler]
        processors = -3
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidConfiguration);
}

TEST_F(ConfigTest, ProcessorsBeyondUint32Rejected) {
    for (const char* value : {"4294967296", "4294967297"}) {
        auto path = write_toml(std::string{"[scheduler]\nprocessors = "} + value + "\n");
        auto result = load_config(path);
        ASSERT_FALSE(result.has_value()) << value;
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidConfiguration) << value;
        EXPECT_NE(result.error().message.find("scheduler.processors"), std::string::npos);
    }
}

TEST_F(ConfigTest, LargestProcessorCountAccepted) {
    auto path = write_toml(R"(
        [scheduler]
        processors = 4294967295
    )");
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->scheduler.processors, 4294967295u);
}

TEST_F(ConfigTest, NegativeTelemetryLimitsRejected) {
    for (const char* field : {"max_file_size_mb", "rotate_count"}) {
        auto path = write_toml(std::string{"[telemetry]\n"} + field + " = -1\n");
        auto result = load_config(path);
        ASSERT_FALSE(result.has_value()) << field;
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidConfiguration) << field;
        EXPECT_NE(result.error().message.find(field), std::string::npos) << field;
    }
}

TEST_F(ConfigTest, OversizedRotateCountRejected) {
    auto path = write_toml(R"(
        [telemetry]
        rotate_count = 8589934592
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidConfiguration);
}

TEST_F(ConfigTest, UnknownLogLevelRejected) {
    auto path = write_toml(R"(
        [telemetry]
        log_level = "chatty"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidConfiguration);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Io);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Parse);
}

TEST(ApplyModeTest, CompareAndPolicies) {
    SchedulerConfig config;
    ASSERT_TRUE(apply_mode(config, "descending").has_value());
    EXPECT_EQ(config.mode, RunMode::Single);
    EXPECT_EQ(config.policy, SchedulingPolicy::Descending);

    ASSERT_TRUE(apply_mode(config, "compare").has_value());
    EXPECT_EQ(config.mode, RunMode::Compare);

    EXPECT_FALSE(apply_mode(config, "bogus").has_value());
}
