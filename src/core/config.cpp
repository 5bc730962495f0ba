/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace shift_roster {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::FileNotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [input]
        if (auto input = tbl["input"]; input.is_table()) {
            config.input.roster_path = input["roster_path"].value_or(
                config.input.roster_path.string());
        }

        // [display]
        if (auto display = tbl["display"]; display.is_table()) {
            config.display.show_summary = display["show_summary"].value_or(true);
            auto width = display["line_width"].value_or(int64_t{80});
            if (width < 40 || width > 400) {
                return Error{ErrorCode::InvalidInput,
                             "display.line_width must be within [40, 400], got "
                             + std::to_string(width)};
            }
            config.display.line_width = static_cast<uint32_t>(width);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics = telemetry["metrics"].value_or(false);
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace shift_roster
