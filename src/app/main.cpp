/**
 * @file main.cpp
 * @brief ShiftRoster command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into one scheduling run:
 *   Config → Logger → Roster file → PreferenceStore → ShiftAssigner → Telemetry → Printer
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "display/schedule_printer.hpp"
#include "input/roster_file.hpp"
#include "roster/preference_store.hpp"
#include "roster/schedule.hpp"
#include "scheduler/shift_assigner.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace shift_roster;

namespace {

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path roster_path;
    std::optional<std::string> log_dir;
    std::string log_level;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--roster" && i + 1 < argc) {
            args.roster_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: shift_roster [OPTIONS]\n"
                      << "  --config <path>      Configuration file (default: config/default.toml)\n"
                      << "  --roster <path>      Employee preference file (TOML)\n"
                      << "  --log-dir <path>     Log output directory (\"\" logs to stderr)\n"
                      << "  --log-level <level>  debug, info, warn or error\n"
                      << "  --demo               Schedule a built-in sample roster\n"
                      << "  --help, -h           Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_sink(const std::filesystem::path& log_dir, const std::string& prefix) {
    if (log_dir.empty()) return std::make_unique<StderrSink>();

    auto sink = std::make_unique<JsonFileSink>(log_dir, prefix);
    if (!sink->is_open()) {
        std::cerr << "Cannot open " << sink->path().string() << ", logging to stderr" << std::endl;
        return std::make_unique<StderrSink>();
    }
    return sink;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.roster_path.empty()) config.input.roster_path = args.roster_path;
    if (args.log_dir) config.telemetry.log_dir = *args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << level.error().message << ", using info" << std::endl;
    }
    Logger logger(make_sink(config.telemetry.log_dir, "shift_roster"),
                  level.value_or(LogLevel::Info));
    logger.info("ShiftRoster starting...");

    // ── Load Roster ──────────────────────────
    std::vector<RosterEntry> entries;
    if (args.demo_mode) {
        logger.info("Using built-in demo roster");
        entries = demo_roster();
    } else {
        logger.info("Roster file: " + config.input.roster_path.string());
        auto roster = load_roster(config.input.roster_path);
        if (!roster) {
            logger.error("Failed to load roster: " + roster.error().message);
            std::cerr << "Failed to load roster: " << roster.error().message << std::endl;
            return 1;
        }
        entries = std::move(*roster);
    }

    PreferenceStore store;
    auto added = populate(store, entries, &logger);
    logger.info("Registered " + std::to_string(added) + " employee(s)");

    // ── Schedule ─────────────────────────────
    ShiftAssigner assigner(store, &logger);
    logger.info(std::string{"Scheduling with policy "} + std::string{ShiftAssigner::name()});
    auto outcome = assigner.run();
    if (!outcome) {
        logger.error("Scheduling aborted: " + outcome.error().message);
        std::cerr << "Scheduling aborted: " << outcome.error().message << std::endl;
        return 1;
    }

    auto gaps = coverage_gaps(outcome->schedule);
    for (const auto& gap : gaps) {
        logger.warn(std::string{to_string(gap.day)} + " " + std::string{to_string(gap.shift)}
                    + " understaffed: " + std::to_string(gap.staffed) + "/"
                    + std::to_string(kMinEmployeesPerShift));
    }

    // ── Telemetry ────────────────────────────
    if (config.telemetry.metrics) {
        MetricsCollector metrics(make_sink(config.telemetry.log_dir, "shift_roster_metrics"));
        for (const auto& decision : outcome->decisions) {
            metrics.record_assignment(decision);
        }
        for (const auto& gap : gaps) {
            metrics.record_coverage_gap(gap);
        }
        metrics.record_outcome(*outcome, store.size());
        metrics.flush();
    }

    print_schedule(std::cout, *outcome, store, config.display);

    logger.info("ShiftRoster finished: " + std::to_string(outcome->schedule.total_assignments())
                + " assignment(s), " + std::to_string(gaps.size()) + " coverage gap(s)");
    logger.flush();
    return 0;
}
