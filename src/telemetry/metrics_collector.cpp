/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include "scheduler/shift_assigner.hpp"

#include <sstream>

namespace shift_roster {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_assignment(const AssignmentDecision& decision) {
    std::ostringstream oss;
    oss << R"({"event":"assignment")"
        << R"(,"employee":")" << json_escape(decision.employee) << "\""
        << R"(,"day":")" << to_string(decision.day) << "\""
        << R"(,"shift":")" << to_string(decision.shift) << "\""
        << R"(,"reason":")" << to_string(decision.reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_coverage_gap(const CoverageGap& gap) {
    std::ostringstream oss;
    oss << R"({"event":"coverage_gap")"
        << R"(,"day":")" << to_string(gap.day) << "\""
        << R"(,"shift":")" << to_string(gap.shift) << "\""
        << R"(,"staffed":)" << gap.staffed
        << R"(,"required":)" << kMinEmployeesPerShift
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_outcome(const RosterOutcome& outcome, std::size_t employee_count) {
    using Reason = AssignmentDecision::Reason;

    std::ostringstream oss;
    oss << R"({"policy":")" << ShiftAssigner::name() << "\""
        << R"(,"employees":)" << employee_count
        << R"(,"assignments":)" << outcome.schedule.total_assignments()
        << R"(,"preference":)" << outcome.count(Reason::Preference)
        << R"(,"backfill":)" << outcome.count(Reason::Backfill)
        << R"(,"reconciliation":)" << outcome.count(Reason::Reconciliation)
        << R"(,"coverage_gaps":)" << coverage_gaps(outcome.schedule).size()
        << "}";
    record_custom("roster_summary", oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace shift_roster
