/**
 * @file shift_assigner.hpp
 * @brief Three-pass greedy assignment of employees to the weekly grid.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "roster/preference_store.hpp"
#include "roster/schedule.hpp"
#include "scheduler/scheduler.hpp"

#include <string_view>
#include <vector>

namespace shift_roster {

/**
 * @brief Builds one week's roster from a PreferenceStore.
 *
 * Construct a fresh assigner per run. run() executes the three passes once,
 * in order. The passes are also public so callers can inspect the grid
 * between them; they must then be invoked in order on the same containers.
 *
 * Employees are always visited in registration order and days in week
 * order, which makes the result a pure function of the store contents.
 */
class ShiftAssigner {
public:
    explicit ShiftAssigner(const PreferenceStore& store, Logger* logger = nullptr);

    /**
     * @brief Run all passes on an empty Schedule and WorkloadCounter.
     *
     * Fails only with ErrorCode::UnknownEmployee (the store handed out a
     * name it cannot resolve) or ErrorCode::Internal when called twice.
     */
    Result<RosterOutcome> run();

    /// Pass 1: each employee's first choice on each wanted day, no staffing cap.
    Result<void> place_preferences(Schedule& schedule, WorkloadCounter& workload);

    /// Pass 2: fill every slot up to kMinEmployeesPerShift where anyone is free.
    void backfill_coverage(Schedule& schedule, WorkloadCounter& workload);

    /// Pass 3: give wanted-but-unscheduled days a shift from the day's ranking.
    Result<void> reconcile_conflicts(Schedule& schedule, WorkloadCounter& workload);

    [[nodiscard]] const std::vector<AssignmentDecision>& decisions() const noexcept {
        return decisions_;
    }

    [[nodiscard]] static constexpr std::string_view name() noexcept { return "three_pass_greedy"; }

private:
    bool place(Schedule& schedule, WorkloadCounter& workload,
               const EmployeeName& employee, Day day, ShiftKind shift,
               AssignmentDecision::Reason reason);

    void log_pass_summary(std::string_view pass, std::size_t placed_before);

    const PreferenceStore& store_;
    Logger* logger_;
    std::vector<AssignmentDecision> decisions_;
    bool ran_ = false;
};

}  // namespace shift_roster
