/**
 * @file roster_outcome.cpp
 * @brief RosterOutcome helper method implementations.
 * @author Dimitris Kafetzis
 */

#include "scheduler/scheduler.hpp"

#include <algorithm>

namespace shift_roster {

std::size_t RosterOutcome::count(AssignmentDecision::Reason reason) const noexcept {
    return static_cast<std::size_t>(
        std::count_if(decisions.begin(), decisions.end(),
                      [reason](const AssignmentDecision& d) { return d.reason == reason; }));
}

}  // namespace shift_roster
