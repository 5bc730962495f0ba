/**
 * @file scheduler.hpp
 * @brief Assignment decisions and the outcome of a scheduling run.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "roster/schedule.hpp"

#include <string_view>
#include <vector>

namespace shift_roster {

// ─────────────────────────────────────────────
// Assignment Decision
// ─────────────────────────────────────────────

struct AssignmentDecision {
    EmployeeName employee;
    Day day;
    ShiftKind shift;

    enum class Reason : uint8_t {
        Preference,       ///< First choice, placement pass
        Backfill,         ///< Coverage floor, ignores preferences
        Reconciliation    ///< Wanted day recovered after backfill
    } reason;

    bool operator==(const AssignmentDecision&) const = default;
};

[[nodiscard]] constexpr std::string_view to_string(AssignmentDecision::Reason reason) noexcept {
    switch (reason) {
        case AssignmentDecision::Reason::Preference:     return "preference";
        case AssignmentDecision::Reason::Backfill:       return "backfill";
        case AssignmentDecision::Reason::Reconciliation: return "reconciliation";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Roster Outcome
// ─────────────────────────────────────────────

/**
 * @brief Everything a scheduling run produces.
 *
 * decisions lists every placement in the order it was made; replaying it
 * into an empty Schedule reproduces schedule.
 */
struct RosterOutcome {
    Schedule schedule;
    WorkloadCounter workload;
    std::vector<AssignmentDecision> decisions;

    [[nodiscard]] std::size_t count(AssignmentDecision::Reason reason) const noexcept;
};

}  // namespace shift_roster
