/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace shift_roster;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "sr_test_config";
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
    EXPECT_EQ(config.input.roster_path.string(), "config/sample_roster.toml");
    EXPECT_TRUE(config.display.show_summary);
    EXPECT_EQ(config.display.line_width, 80u);
    EXPECT_EQ(config.telemetry.log_level, "info");
    EXPECT_FALSE(config.telemetry.metrics);
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [input]
        roster_path = "/srv/rosters/week42.toml"

        [display]
        show_summary = false
        line_width = 100

        [telemetry]
        log_dir = "/tmp/sr_logs"
        log_level = "debug"
        metrics = true
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.input.roster_path.string(), "/srv/rosters/week42.toml");
    EXPECT_FALSE(config.display.show_summary);
    EXPECT_EQ(config.display.line_width, 100u);
    EXPECT_EQ(config.telemetry.log_dir.string(), "/tmp/sr_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_TRUE(config.telemetry.metrics);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [telemetry]
        log_level = "warn"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->telemetry.log_level, "warn");
    // Defaults for everything else
    EXPECT_EQ(result->input.roster_path.string(), "config/sample_roster.toml");
    EXPECT_EQ(result->display.line_width, 80u);
    EXPECT_TRUE(result->display.show_summary);
}

TEST_F(ConfigTest, LineWidthOutOfRange) {
    auto path = write_toml(R"(
        [display]
        line_width = 5
    )");

    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::FileNotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
}
