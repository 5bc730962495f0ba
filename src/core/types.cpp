/**
 * @file types.cpp
 * @brief Day and shift name parsing.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace shift_roster {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](char x, char y) {
                          return std::tolower(static_cast<unsigned char>(x))
                                 == std::tolower(static_cast<unsigned char>(y));
                      });
}

}  // anonymous namespace

std::string_view trim(std::string_view text) noexcept {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

Result<Day> parse_day(std::string_view text) {
    auto name = trim(text);
    for (auto day : kWeek) {
        if (iequals(name, to_string(day))) return day;
    }
    return Error{ErrorCode::InvalidInput,
                 "Invalid day '" + std::string{name}
                 + "'. Choose from: Monday, Tuesday, Wednesday, Thursday, "
                   "Friday, Saturday, Sunday"};
}

Result<ShiftKind> parse_shift_kind(std::string_view text) {
    auto name = trim(text);
    for (auto shift : kShifts) {
        if (iequals(name, to_string(shift))) return shift;
    }
    return Error{ErrorCode::InvalidInput,
                 "Invalid shift '" + std::string{name}
                 + "'. Choose from: Morning, Afternoon, Evening"};
}

}  // namespace shift_roster
