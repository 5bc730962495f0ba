/**
 * @file schedule.cpp
 * @brief Schedule and WorkloadCounter implementations.
 * @author Dimitris Kafetzis
 */

#include "roster/schedule.hpp"

#include <algorithm>

namespace shift_roster {

// ── Schedule ─────────────────────────────────

bool Schedule::add(Day day, ShiftKind shift, const EmployeeName& name) {
    if (is_scheduled_on(day, name)) return false;
    slots_[index_of(day)][index_of(shift)].push_back(name);
    return true;
}

bool Schedule::contains(Day day, ShiftKind shift, const EmployeeName& name) const {
    const auto& slot = employees(day, shift);
    return std::find(slot.begin(), slot.end(), name) != slot.end();
}

bool Schedule::is_scheduled_on(Day day, const EmployeeName& name) const {
    return shift_of(day, name).has_value();
}

std::optional<ShiftKind> Schedule::shift_of(Day day, const EmployeeName& name) const {
    for (auto shift : kShifts) {
        if (contains(day, shift, name)) return shift;
    }
    return std::nullopt;
}

std::vector<Day> Schedule::days_scheduled(const EmployeeName& name) const {
    std::vector<Day> days;
    for (auto day : kWeek) {
        if (is_scheduled_on(day, name)) days.push_back(day);
    }
    return days;
}

std::size_t Schedule::total_assignments() const noexcept {
    std::size_t total = 0;
    for (const auto& day : slots_) {
        for (const auto& slot : day) total += slot.size();
    }
    return total;
}

// ── WorkloadCounter ──────────────────────────

bool WorkloadCounter::increment(const EmployeeName& name) {
    auto& count = counts_[name];
    if (count >= kMaxDaysPerWeek) return false;
    ++count;
    return true;
}

uint32_t WorkloadCounter::days_worked(const EmployeeName& name) const {
    auto it = counts_.find(name);
    return it == counts_.end() ? 0u : it->second;
}

// ── Coverage ─────────────────────────────────

std::vector<CoverageGap> coverage_gaps(const Schedule& schedule) {
    std::vector<CoverageGap> gaps;
    for (auto day : kWeek) {
        for (auto shift : kShifts) {
            auto staffed = schedule.staffing(day, shift);
            if (staffed < kMinEmployeesPerShift) {
                gaps.push_back({day, shift, staffed});
            }
        }
    }
    return gaps;
}

}  // namespace shift_roster
