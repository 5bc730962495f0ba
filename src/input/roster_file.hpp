/**
 * @file roster_file.hpp
 * @brief Loading and validating employee preferences from TOML.
 * @author Dimitris Kafetzis
 *
 * File layout:
 *
 *   [[employee]]
 *   name = "Alice"
 *   [employee.preferences]
 *   Monday = ["Morning", "Afternoon"]
 *   Friday = ["Evening"]
 *
 * Employees are returned in file order, which becomes registration order.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "roster/preference_store.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace shift_roster {

/// Most days a single employee may ask for.
inline constexpr std::size_t kMaxPreferredDays = kMaxDaysPerWeek;

struct RosterEntry {
    EmployeeName name;
    PreferencePlan plan;

    bool operator==(const RosterEntry&) const = default;
};

/**
 * @brief Check one employee's data against the input rules.
 *
 * Name must be non-empty, 1 to kMaxPreferredDays days, each day's ranking
 * non-empty, at most kMaxRankedShifts long and free of repeats.
 */
Result<void> validate_entry(const RosterEntry& entry);

/**
 * @brief Parse roster TOML text. Every entry is validated.
 */
Result<std::vector<RosterEntry>> parse_roster(std::string_view toml_text);

/**
 * @brief Load and parse a roster file.
 */
Result<std::vector<RosterEntry>> load_roster(const std::filesystem::path& path);

/**
 * @brief Register entries in order.
 * @return Number of entries actually added (repeated names are skipped).
 */
std::size_t populate(PreferenceStore& store,
                     const std::vector<RosterEntry>& entries,
                     Logger* logger = nullptr);

/**
 * @brief A small fixed roster used by `--demo`.
 */
std::vector<RosterEntry> demo_roster();

}  // namespace shift_roster
