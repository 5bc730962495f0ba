/**
 * @file schedule.hpp
 * @brief The weekly shift grid and the per-employee day counter.
 * @author Dimitris Kafetzis
 *
 * Both containers are append-only. Schedule::add refuses a second shift for
 * the same employee on the same day, and WorkloadCounter::increment refuses
 * to go past kMaxDaysPerWeek, so the two roster invariants hold structurally.
 */

#pragma once

#include "core/types.hpp"

#include <array>
#include <optional>
#include <unordered_map>
#include <vector>

namespace shift_roster {

/**
 * @brief Fixed 7 x 3 grid of (Day, ShiftKind) -> employees in placement order.
 */
class Schedule {
public:
    Schedule() = default;

    /**
     * @brief Append an employee to a shift.
     * @return false (and no change) if the employee already works that day.
     */
    bool add(Day day, ShiftKind shift, const EmployeeName& name);

    [[nodiscard]] const std::vector<EmployeeName>& employees(Day day, ShiftKind shift) const noexcept {
        return slots_[index_of(day)][index_of(shift)];
    }

    [[nodiscard]] std::size_t staffing(Day day, ShiftKind shift) const noexcept {
        return employees(day, shift).size();
    }

    [[nodiscard]] bool contains(Day day, ShiftKind shift, const EmployeeName& name) const;
    [[nodiscard]] bool is_scheduled_on(Day day, const EmployeeName& name) const;
    [[nodiscard]] std::optional<ShiftKind> shift_of(Day day, const EmployeeName& name) const;

    /// Days on which the employee holds a shift, in week order.
    [[nodiscard]] std::vector<Day> days_scheduled(const EmployeeName& name) const;

    [[nodiscard]] std::size_t total_assignments() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return total_assignments() == 0; }

    bool operator==(const Schedule&) const = default;

private:
    std::array<std::array<std::vector<EmployeeName>, kShiftCount>, kDayCount> slots_{};
};

/**
 * @brief Employee -> number of days currently assigned.
 */
class WorkloadCounter {
public:
    /**
     * @brief Count one more working day.
     * @return false (and no change) if the employee is already at the cap.
     */
    bool increment(const EmployeeName& name);

    /// 0 for employees that hold no shift.
    [[nodiscard]] uint32_t days_worked(const EmployeeName& name) const;

    [[nodiscard]] bool at_cap(const EmployeeName& name) const {
        return days_worked(name) >= kMaxDaysPerWeek;
    }

    [[nodiscard]] const std::unordered_map<EmployeeName, uint32_t>& entries() const noexcept {
        return counts_;
    }

    bool operator==(const WorkloadCounter&) const = default;

private:
    std::unordered_map<EmployeeName, uint32_t> counts_;
};

// ─────────────────────────────────────────────
// Coverage
// ─────────────────────────────────────────────

/**
 * @brief A slot still below kMinEmployeesPerShift.
 */
struct CoverageGap {
    Day day;
    ShiftKind shift;
    std::size_t staffed;

    bool operator==(const CoverageGap&) const = default;
};

/// Understaffed slots in (Day, ShiftKind) order.
[[nodiscard]] std::vector<CoverageGap> coverage_gaps(const Schedule& schedule);

}  // namespace shift_roster
