/**
 * @file types.hpp
 * @brief Fundamental types used throughout ShiftRoster.
 * @author Dimitris Kafetzis
 *
 * Defines Day, ShiftKind, EmployeeName, the fixed staffing constants and the
 * name conversions shared by the input, scheduling and display layers.
 */

#pragma once

#include "core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace shift_roster {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using EmployeeName = std::string;

// ─────────────────────────────────────────────
// Staffing Constants
// ─────────────────────────────────────────────

inline constexpr std::size_t kDayCount = 7;
inline constexpr std::size_t kShiftCount = 3;

inline constexpr uint32_t kMinEmployeesPerShift = 2;
inline constexpr uint32_t kMaxDaysPerWeek = 5;

/// Longest ranked shift list an employee may give for a single day.
inline constexpr std::size_t kMaxRankedShifts = kShiftCount;

// ─────────────────────────────────────────────
// Day
// ─────────────────────────────────────────────

enum class Day : uint8_t {
    Monday,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday,
    Sunday
};

inline constexpr std::array<Day, kDayCount> kWeek = {
    Day::Monday, Day::Tuesday, Day::Wednesday, Day::Thursday,
    Day::Friday, Day::Saturday, Day::Sunday
};

[[nodiscard]] constexpr std::string_view to_string(Day day) noexcept {
    switch (day) {
        case Day::Monday:    return "Monday";
        case Day::Tuesday:   return "Tuesday";
        case Day::Wednesday: return "Wednesday";
        case Day::Thursday:  return "Thursday";
        case Day::Friday:    return "Friday";
        case Day::Saturday:  return "Saturday";
        case Day::Sunday:    return "Sunday";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::size_t index_of(Day day) noexcept {
    return static_cast<std::size_t>(day);
}

// ─────────────────────────────────────────────
// ShiftKind
// ─────────────────────────────────────────────

enum class ShiftKind : uint8_t {
    Morning,
    Afternoon,
    Evening
};

inline constexpr std::array<ShiftKind, kShiftCount> kShifts = {
    ShiftKind::Morning, ShiftKind::Afternoon, ShiftKind::Evening
};

[[nodiscard]] constexpr std::string_view to_string(ShiftKind shift) noexcept {
    switch (shift) {
        case ShiftKind::Morning:   return "Morning";
        case ShiftKind::Afternoon: return "Afternoon";
        case ShiftKind::Evening:   return "Evening";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::size_t index_of(ShiftKind shift) noexcept {
    return static_cast<std::size_t>(shift);
}

// ─────────────────────────────────────────────
// Name Parsing
// ─────────────────────────────────────────────

/**
 * @brief Parse a day name, ignoring case and surrounding whitespace.
 *
 * "monday", " MONDAY " and "Monday" all map to Day::Monday.
 */
Result<Day> parse_day(std::string_view text);

/**
 * @brief Parse a shift name, ignoring case and surrounding whitespace.
 */
Result<ShiftKind> parse_shift_kind(std::string_view text);

/// Strip leading and trailing ASCII whitespace.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

}  // namespace shift_roster
