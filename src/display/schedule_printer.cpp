/**
 * @file schedule_printer.cpp
 * @brief Schedule and work summary rendering.
 * @author Dimitris Kafetzis
 */

#include "display/schedule_printer.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <vector>

namespace shift_roster {

namespace {

constexpr std::size_t kDayRuleWidth = 60;
constexpr int kShiftColumn = 12;
constexpr int kNameColumn = 20;

std::string upper(std::string_view text) {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string join(const std::vector<EmployeeName>& names) {
    std::string result;
    for (const auto& name : names) {
        if (!result.empty()) result += ", ";
        result += name;
    }
    return result;
}

void print_banner(std::ostream& out, std::string_view title, std::size_t width) {
    std::string rule(width, '=');
    out << '\n' << rule << '\n'
        << center(title, width) << '\n'
        << rule << "\n\n";
}

}  // anonymous namespace

std::string center(std::string_view text, std::size_t width) {
    if (text.size() >= width) return std::string{text};
    auto left = (width - text.size()) / 2;
    auto right = width - text.size() - left;
    return std::string(left, ' ') + std::string{text} + std::string(right, ' ');
}

void print_schedule(std::ostream& out,
                    const RosterOutcome& outcome,
                    const PreferenceStore& store,
                    const DisplayConfig& display) {
    const auto width = static_cast<std::size_t>(display.line_width);

    print_banner(out, "EMPLOYEE SCHEDULE FOR THE WEEK", width);

    for (auto day : kWeek) {
        out << '\n' << upper(to_string(day)) << '\n'
            << std::string(kDayRuleWidth, '-') << '\n';

        for (auto shift : kShifts) {
            const auto& names = outcome.schedule.employees(day, shift);
            out << "  " << std::left << std::setw(kShiftColumn) << to_string(shift)
                << " : " << (names.empty() ? "No employees assigned" : join(names)) << '\n';
        }
    }

    if (display.show_summary) {
        print_banner(out, "EMPLOYEE WORK SUMMARY", width);

        auto names = store.employees();
        std::sort(names.begin(), names.end());
        for (const auto& name : names) {
            out << "  " << std::left << std::setw(kNameColumn) << name
                << " : " << outcome.workload.days_worked(name) << " days\n";
        }
    }

    out << '\n' << std::string(width, '=') << "\n\n";
}

std::string format_schedule(const RosterOutcome& outcome,
                            const PreferenceStore& store,
                            const DisplayConfig& display) {
    std::ostringstream oss;
    print_schedule(oss, outcome, store, display);
    return oss.str();
}

}  // namespace shift_roster
