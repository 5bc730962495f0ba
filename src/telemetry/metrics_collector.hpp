/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "roster/schedule.hpp"
#include "scheduler/scheduler.hpp"

#include <memory>
#include <mutex>

namespace shift_roster {

/**
 * @brief Collects and logs structured roster events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_assignment(const AssignmentDecision& decision);
    void record_coverage_gap(const CoverageGap& gap);
    void record_outcome(const RosterOutcome& outcome, std::size_t employee_count);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace shift_roster
