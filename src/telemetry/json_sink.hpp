/**
 * @file json_sink.hpp
 * @brief Log sinks: NDJSON file and stderr.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace shift_roster {

/**
 * @brief Appends NDJSON lines to <log_dir>/<prefix>.ndjson.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir, const std::string& prefix);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] bool is_open() const noexcept { return current_file_.is_open(); }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream current_file_;
};

/**
 * @brief Writes to stderr, keeping stdout free for the printed schedule.
 */
class StderrSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

}  // namespace shift_roster
