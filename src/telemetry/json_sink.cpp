/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 * @author Dimitris Kafetzis
 */

#include "telemetry/json_sink.hpp"

#include <iostream>

namespace shift_roster {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir, const std::string& prefix)
    : path_(log_dir / (prefix + ".ndjson")) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (!ec) {
        current_file_.open(path_, std::ios::app);
    }
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

void JsonFileSink::write(std::string_view json_line) {
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

// ── StderrSink ───────────────────────────────

void StderrSink::write(std::string_view json_line) {
    std::cerr << json_line << '\n';
}

void StderrSink::flush() {
    std::cerr.flush();
}

}  // namespace shift_roster
