/**
 * @file schedule_printer.hpp
 * @brief Plain-text rendering of a finished roster.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "roster/preference_store.hpp"
#include "scheduler/scheduler.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace shift_roster {

/**
 * @brief Print the weekly grid and, if enabled, the per-employee summary.
 *
 * The summary lists every registered employee sorted by name, including
 * those who ended up with zero days.
 */
void print_schedule(std::ostream& out,
                    const RosterOutcome& outcome,
                    const PreferenceStore& store,
                    const DisplayConfig& display = {});

/// Render to a string; convenience wrapper over print_schedule.
std::string format_schedule(const RosterOutcome& outcome,
                            const PreferenceStore& store,
                            const DisplayConfig& display = {});

/// Center text in a field of the given width (left-biased when uneven).
std::string center(std::string_view text, std::size_t width);

}  // namespace shift_roster
