/**
 * @file shift_assigner.cpp
 * @brief ShiftAssigner — preference placement, coverage backfill and
 *        conflict reconciliation over the weekly grid.
 * @author Dimitris Kafetzis
 *
 * Algorithm:
 *   Pass 1, for each employee, for each day:
 *     stop at the day cap; if the day is wanted and free,
 *     take the first ranked shift (an empty ranking ends the employee's pass)
 *   Pass 2, for each (day, shift) below the floor:
 *     add the first employee under the cap who is free that day
 *   Pass 3, for each employee, for each wanted day still free:
 *     stop at the day cap; take the first ranked shift not yet held
 *
 * Complexity: O(E × D × S) for passes 1 and 3, O(D × S × F × E) for pass 2
 * where F = kMinEmployeesPerShift.
 */

#include "scheduler/shift_assigner.hpp"

#include <algorithm>
#include <string>

namespace shift_roster {

ShiftAssigner::ShiftAssigner(const PreferenceStore& store, Logger* logger)
    : store_(store), logger_(logger) {}

Result<RosterOutcome> ShiftAssigner::run() {
    if (ran_) {
        return Error{ErrorCode::Internal, "ShiftAssigner::run may only be called once"};
    }
    ran_ = true;

    Schedule schedule;
    WorkloadCounter workload;

    auto placed = decisions_.size();
    if (auto pass = place_preferences(schedule, workload); !pass) {
        return pass.error();
    }
    log_pass_summary("preference", placed);

    placed = decisions_.size();
    backfill_coverage(schedule, workload);
    log_pass_summary("backfill", placed);

    placed = decisions_.size();
    if (auto pass = reconcile_conflicts(schedule, workload); !pass) {
        return pass.error();
    }
    log_pass_summary("reconciliation", placed);

    return RosterOutcome{std::move(schedule), std::move(workload), decisions_};
}

// ── Pass 1 ───────────────────────────────────

Result<void> ShiftAssigner::place_preferences(Schedule& schedule, WorkloadCounter& workload) {
    for (const auto& employee : store_.employees()) {
        auto plan = store_.plan_for(employee);
        if (!plan) return plan.error();

        for (auto day : kWeek) {
            if (workload.at_cap(employee)) break;

            const auto& ranking = (*plan)->ranking(day);
            if (!ranking) continue;
            if (schedule.is_scheduled_on(day, employee)) continue;

            // An empty ranking ends this employee's placement for the week.
            if (ranking->empty()) break;

            place(schedule, workload, employee, day, ranking->front(),
                  AssignmentDecision::Reason::Preference);
        }
    }
    return {};
}

// ── Pass 2 ───────────────────────────────────

void ShiftAssigner::backfill_coverage(Schedule& schedule, WorkloadCounter& workload) {
    const auto& employees = store_.employees();

    for (auto day : kWeek) {
        for (auto shift : kShifts) {
            while (schedule.staffing(day, shift) < kMinEmployeesPerShift) {
                auto candidate = std::find_if(
                    employees.begin(), employees.end(),
                    [&](const EmployeeName& employee) {
                        return !workload.at_cap(employee)
                            && !schedule.is_scheduled_on(day, employee)
                            && !schedule.contains(day, shift, employee);
                    });

                if (candidate == employees.end()) break;
                if (!place(schedule, workload, *candidate, day, shift,
                           AssignmentDecision::Reason::Backfill)) {
                    break;
                }
            }
        }
    }
}

// ── Pass 3 ───────────────────────────────────

Result<void> ShiftAssigner::reconcile_conflicts(Schedule& schedule, WorkloadCounter& workload) {
    static const ShiftRanking kAnyShift(kShifts.begin(), kShifts.end());

    for (const auto& employee : store_.employees()) {
        auto plan = store_.plan_for(employee);
        if (!plan) return plan.error();

        auto scheduled = schedule.days_scheduled(employee);

        for (auto day : (*plan)->preferred_days()) {
            if (std::find(scheduled.begin(), scheduled.end(), day) != scheduled.end()) {
                continue;
            }
            if (workload.at_cap(employee)) break;

            const auto& ranking = (*plan)->ranking(day);
            const ShiftRanking& candidates = ranking ? *ranking : kAnyShift;

            for (auto shift : candidates) {
                if (schedule.contains(day, shift, employee)) continue;
                if (place(schedule, workload, employee, day, shift,
                          AssignmentDecision::Reason::Reconciliation)) {
                    scheduled.push_back(day);
                    break;
                }
            }
        }
    }
    return {};
}

// ── Helpers ──────────────────────────────────

bool ShiftAssigner::place(Schedule& schedule, WorkloadCounter& workload,
                          const EmployeeName& employee, Day day, ShiftKind shift,
                          AssignmentDecision::Reason reason) {
    // Guarded up front so add() and increment() succeed together.
    if (workload.at_cap(employee) || schedule.is_scheduled_on(day, employee)) return false;
    if (!schedule.add(day, shift, employee) || !workload.increment(employee)) return false;

    decisions_.push_back({employee, day, shift, reason});

    if (logger_ && logger_->enabled(LogLevel::Debug)) {
        logger_->debug("Assign " + employee + " -> " + std::string{to_string(day)} + " "
                       + std::string{to_string(shift)} + " (" + std::string{to_string(reason)} + ")");
    }
    return true;
}

void ShiftAssigner::log_pass_summary(std::string_view pass, std::size_t placed_before) {
    if (!logger_) return;
    logger_->info(std::string{name()} + ": " + std::string{pass} + " pass placed "
                  + std::to_string(decisions_.size() - placed_before) + " shift(s)");
}

}  // namespace shift_roster
