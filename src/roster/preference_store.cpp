/**
 * @file preference_store.cpp
 * @brief PreferenceStore implementation.
 * @author Dimitris Kafetzis
 */

#include "roster/preference_store.hpp"

#include <algorithm>

namespace shift_roster {

std::vector<Day> PreferencePlan::preferred_days() const {
    std::vector<Day> result;
    for (auto day : kWeek) {
        if (has_preference(day)) result.push_back(day);
    }
    return result;
}

std::size_t PreferencePlan::day_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(days.begin(), days.end(),
                      [](const auto& entry) { return entry.has_value(); }));
}

bool PreferenceStore::add_employee(EmployeeName name, PreferencePlan plan) {
    if (plans_.contains(name)) return false;

    order_.push_back(name);
    plans_.emplace(std::move(name), std::move(plan));
    return true;
}

Result<const PreferencePlan*> PreferenceStore::plan_for(const EmployeeName& name) const {
    auto it = plans_.find(name);
    if (it == plans_.end()) {
        return Error{ErrorCode::UnknownEmployee, "Unknown employee: " + name};
    }
    return &it->second;
}

bool PreferenceStore::contains(const EmployeeName& name) const {
    return plans_.contains(name);
}

}  // namespace shift_roster
