/**
 * @file preference_store.hpp
 * @brief Per-employee ranked shift preferences, kept in registration order.
 * @author Dimitris Kafetzis
 *
 * The store is populated once by the input layer and is read-only while the
 * assigner runs. Registration order is part of the contract: every pass
 * walks employees in that order, so earlier registrations win contention.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <unordered_map>
#include <vector>

namespace shift_roster {

/// Shifts for one day, most wanted first.
using ShiftRanking = std::vector<ShiftKind>;

/**
 * @brief One employee's wishes for the week.
 *
 * A day with no entry means "no preference". A day whose entry is an empty
 * ranking is distinct from that and is treated specially by the assigner.
 */
struct PreferencePlan {
    std::array<std::optional<ShiftRanking>, kDayCount> days{};

    PreferencePlan& set(Day day, ShiftRanking ranking) {
        days[index_of(day)] = std::move(ranking);
        return *this;
    }

    [[nodiscard]] const std::optional<ShiftRanking>& ranking(Day day) const noexcept {
        return days[index_of(day)];
    }

    [[nodiscard]] bool has_preference(Day day) const noexcept {
        return days[index_of(day)].has_value();
    }

    /// Days with an entry, in week order.
    [[nodiscard]] std::vector<Day> preferred_days() const;

    [[nodiscard]] std::size_t day_count() const noexcept;

    bool operator==(const PreferencePlan&) const = default;
};

/**
 * @brief Registry of employees and their preference plans.
 */
class PreferenceStore {
public:
    PreferenceStore() = default;

    /**
     * @brief Register an employee.
     * @return false if the name was already registered; the existing plan is kept.
     */
    bool add_employee(EmployeeName name, PreferencePlan plan);

    /**
     * @brief Look up a plan. Fails with ErrorCode::UnknownEmployee.
     *
     * The pointer stays valid for the lifetime of the store.
     */
    [[nodiscard]] Result<const PreferencePlan*> plan_for(const EmployeeName& name) const;

    /// Registered names in registration order.
    [[nodiscard]] const std::vector<EmployeeName>& employees() const noexcept { return order_; }

    [[nodiscard]] bool contains(const EmployeeName& name) const;
    [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }
    [[nodiscard]] bool empty() const noexcept { return order_.empty(); }

private:
    std::vector<EmployeeName> order_;
    std::unordered_map<EmployeeName, PreferencePlan> plans_;
};

}  // namespace shift_roster
