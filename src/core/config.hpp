/**
 * @file config.hpp
 * @brief Application configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace shift_roster {

struct InputConfig {
    std::filesystem::path roster_path = "config/sample_roster.toml";
};

struct DisplayConfig {
    bool show_summary = true;
    uint32_t line_width = 80;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";     ///< empty = stdout
    std::string log_level = "info";
    bool metrics = false;
};

/**
 * @brief Top-level application configuration.
 */
struct Config {
    InputConfig input;
    DisplayConfig display;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace shift_roster
