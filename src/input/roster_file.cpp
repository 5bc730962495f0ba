/**
 * @file roster_file.cpp
 * @brief Roster parsing from TOML using toml++.
 * @author Dimitris Kafetzis
 */

#include "input/roster_file.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <string>

namespace shift_roster {

namespace {

Error invalid(const std::string& who, const std::string& what) {
    return Error{ErrorCode::InvalidInput,
                 who.empty() ? what : "Employee '" + who + "': " + what};
}

Result<ShiftRanking> ranking_from_node(const toml::node& node, const std::string& who,
                                       std::string_view day_key) {
    const auto* arr = node.as_array();
    if (!arr) {
        return invalid(who, "preferences for " + std::string{day_key}
                            + " must be an array of shift names");
    }

    ShiftRanking ranking;
    for (const auto& elem : *arr) {
        auto text = elem.value<std::string>();
        if (!text) {
            return invalid(who, "shift names for " + std::string{day_key} + " must be strings");
        }
        auto shift = parse_shift_kind(*text);
        if (!shift) return invalid(who, shift.error().message);
        ranking.push_back(*shift);
    }
    return ranking;
}

Result<RosterEntry> entry_from_table(const toml::table& tbl, std::size_t position) {
    RosterEntry entry;

    auto name = tbl["name"].value<std::string>();
    if (!name) {
        return invalid("", "employee #" + std::to_string(position + 1) + " has no name");
    }
    entry.name = std::string{trim(*name)};
    if (entry.name.empty()) {
        return invalid("", "employee #" + std::to_string(position + 1) + ": name cannot be empty");
    }

    const auto* prefs = tbl["preferences"].as_table();
    if (!prefs) {
        return invalid(entry.name, "missing [employee.preferences] table");
    }

    for (auto&& [key, value] : *prefs) {
        auto day = parse_day(key.str());
        if (!day) return invalid(entry.name, day.error().message);

        if (entry.plan.has_preference(*day)) {
            return invalid(entry.name, std::string{to_string(*day)}
                                       + " already entered. Choose a different day.");
        }

        auto ranking = ranking_from_node(value, entry.name, key.str());
        if (!ranking) return ranking.error();
        entry.plan.set(*day, std::move(*ranking));
    }

    if (auto valid = validate_entry(entry); !valid) return valid.error();
    return entry;
}

Result<std::vector<RosterEntry>> entries_from_document(const toml::table& doc) {
    std::vector<RosterEntry> entries;

    auto node = doc["employee"];
    if (!node) return entries;

    const auto* employees = node.as_array();
    if (!employees) {
        return Error{ErrorCode::InvalidInput, "'employee' must be an array of tables ([[employee]])"};
    }

    for (std::size_t i = 0; i < employees->size(); ++i) {
        const auto* tbl = employees->get(i)->as_table();
        if (!tbl) {
            return Error{ErrorCode::InvalidInput,
                         "employee #" + std::to_string(i + 1) + " is not a table"};
        }
        auto entry = entry_from_table(*tbl, i);
        if (!entry) return entry.error();
        entries.push_back(std::move(*entry));
    }
    return entries;
}

}  // anonymous namespace

Result<void> validate_entry(const RosterEntry& entry) {
    if (trim(entry.name).empty()) {
        return invalid("", "name cannot be empty");
    }

    auto days = entry.plan.day_count();
    if (days == 0 || days > kMaxPreferredDays) {
        return invalid(entry.name, "must want between 1 and "
                                   + std::to_string(kMaxPreferredDays) + " days, got "
                                   + std::to_string(days));
    }

    for (auto day : entry.plan.preferred_days()) {
        const auto& ranking = *entry.plan.ranking(day);
        auto label = std::string{to_string(day)};

        if (ranking.empty()) {
            return invalid(entry.name, "no shifts ranked for " + label);
        }
        if (ranking.size() > kMaxRankedShifts) {
            return invalid(entry.name, "at most " + std::to_string(kMaxRankedShifts)
                                       + " shifts may be ranked for " + label);
        }
        for (auto it = ranking.begin(); it != ranking.end(); ++it) {
            if (std::find(ranking.begin(), it, *it) != it) {
                return invalid(entry.name, std::string{to_string(*it)} + " already chosen for "
                                           + label + ". Pick a different shift.");
            }
        }
    }
    return {};
}

Result<std::vector<RosterEntry>> parse_roster(std::string_view toml_text) {
    try {
        auto doc = toml::parse(toml_text);
        return entries_from_document(doc);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<std::vector<RosterEntry>> load_roster(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::FileNotFound, "Roster file not found: " + path.string()};
    }

    try {
        auto doc = toml::parse_file(path.string());
        return entries_from_document(doc);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error in "} + path.string() + ": "
                     + std::string{err.description()}};
    }
}

std::size_t populate(PreferenceStore& store,
                     const std::vector<RosterEntry>& entries,
                     Logger* logger) {
    std::size_t added = 0;
    for (const auto& entry : entries) {
        if (store.add_employee(entry.name, entry.plan)) {
            ++added;
        } else if (logger) {
            logger->warn("Ignoring repeated employee '" + entry.name
                         + "'; keeping the first registration");
        }
    }
    return added;
}

std::vector<RosterEntry> demo_roster() {
    constexpr auto Morning = ShiftKind::Morning;
    constexpr auto Afternoon = ShiftKind::Afternoon;
    constexpr auto Evening = ShiftKind::Evening;

    std::vector<RosterEntry> roster;

    roster.push_back({"Alice", PreferencePlan{}
        .set(Day::Monday, {Morning, Afternoon})
        .set(Day::Tuesday, {Morning})
        .set(Day::Wednesday, {Evening, Morning})
        .set(Day::Friday, {Morning})});

    roster.push_back({"Bob", PreferencePlan{}
        .set(Day::Monday, {Morning})
        .set(Day::Thursday, {Afternoon, Evening})
        .set(Day::Saturday, {Evening})});

    roster.push_back({"Carol", PreferencePlan{}
        .set(Day::Tuesday, {Afternoon})
        .set(Day::Wednesday, {Afternoon})
        .set(Day::Thursday, {Afternoon})
        .set(Day::Friday, {Afternoon, Evening, Morning})
        .set(Day::Sunday, {Morning})});

    roster.push_back({"Dave", PreferencePlan{}
        .set(Day::Monday, {Evening})
        .set(Day::Saturday, {Morning, Afternoon})
        .set(Day::Sunday, {Evening})});

    roster.push_back({"Erin", PreferencePlan{}
        .set(Day::Wednesday, {Morning})
        .set(Day::Thursday, {Morning})
        .set(Day::Friday, {Evening})
        .set(Day::Saturday, {Afternoon})});

    return roster;
}

}  // namespace shift_roster
