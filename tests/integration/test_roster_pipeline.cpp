/**
 * @file test_roster_pipeline.cpp
 * @brief Integration tests exercising the full roster pipeline.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "display/schedule_printer.hpp"
#include "input/roster_file.hpp"
#include "roster/preference_store.hpp"
#include "scheduler/shift_assigner.hpp"
#include "support/memory_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <string>

using namespace shift_roster;

namespace {

const std::filesystem::path kConfigDir{SHIFT_ROSTER_CONFIG_DIR};

using Names = std::vector<EmployeeName>;
using Reason = AssignmentDecision::Reason;

PreferenceStore load_sample_store() {
    auto roster = load_roster(kConfigDir / "sample_roster.toml");
    EXPECT_TRUE(roster.has_value()) << (roster ? "" : roster.error().message);

    PreferenceStore store;
    if (roster) populate(store, *roster);
    return store;
}

}  // namespace

// ═══════════════════════════════════════════════
// Shipped Configuration
// ═══════════════════════════════════════════════

TEST(ShippedFilesIntegration, DefaultConfigLoads) {
    auto config = load_config(kConfigDir / "default.toml");
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->input.roster_path.filename().string(), "sample_roster.toml");
    EXPECT_TRUE(parse_log_level(config->telemetry.log_level).has_value());
}

TEST(ShippedFilesIntegration, SampleRosterMatchesDemoRoster) {
    auto roster = load_roster(kConfigDir / "sample_roster.toml");
    ASSERT_TRUE(roster.has_value()) << roster.error().message;
    EXPECT_EQ(*roster, demo_roster());
}

// ═══════════════════════════════════════════════
// Full Pipeline: Roster File → Assigner → Printer
// ═══════════════════════════════════════════════

TEST(PipelineIntegration, SampleRosterSchedule) {
    auto store = load_sample_store();
    ASSERT_EQ(store.size(), 5u);

    auto outcome = ShiftAssigner(store).run();
    ASSERT_TRUE(outcome.has_value());

    const auto& schedule = outcome->schedule;
    EXPECT_EQ(schedule.employees(Day::Monday, ShiftKind::Morning), (Names{"Alice", "Bob"}));
    EXPECT_EQ(schedule.employees(Day::Monday, ShiftKind::Afternoon), (Names{"Erin"}));
    EXPECT_EQ(schedule.employees(Day::Tuesday, ShiftKind::Afternoon), (Names{"Carol", "Dave"}));
    EXPECT_TRUE(schedule.employees(Day::Tuesday, ShiftKind::Evening).empty());
    EXPECT_EQ(schedule.employees(Day::Wednesday, ShiftKind::Morning), (Names{"Erin", "Bob"}));
    EXPECT_EQ(schedule.employees(Day::Thursday, ShiftKind::Morning), (Names{"Erin", "Alice"}));
    EXPECT_EQ(schedule.employees(Day::Sunday, ShiftKind::Morning), (Names{"Carol"}));

    EXPECT_EQ(outcome->decisions.size(), 25u);
    EXPECT_EQ(outcome->count(Reason::Preference), 19u);
    EXPECT_EQ(outcome->count(Reason::Backfill), 6u);
    EXPECT_EQ(outcome->count(Reason::Reconciliation), 0u);
    EXPECT_EQ(coverage_gaps(schedule).size(), 14u);

    for (const auto& name : store.employees()) {
        EXPECT_EQ(outcome->workload.days_worked(name), kMaxDaysPerWeek) << name;
        EXPECT_EQ(schedule.days_scheduled(name).size(), kMaxDaysPerWeek) << name;
    }
}

TEST(PipelineIntegration, EveryPreferredFirstChoiceHonoured) {
    auto store = load_sample_store();
    auto outcome = ShiftAssigner(store).run();
    ASSERT_TRUE(outcome.has_value());

    for (const auto& name : store.employees()) {
        const auto* plan = *store.plan_for(name);
        for (auto day : plan->preferred_days()) {
            EXPECT_EQ(outcome->schedule.shift_of(day, name), plan->ranking(day)->front())
                << name << " on " << to_string(day);
        }
    }
}

TEST(PipelineIntegration, MetricsAndPrinterAgree) {
    auto store = load_sample_store();
    auto outcome = ShiftAssigner(store).run();
    ASSERT_TRUE(outcome.has_value());

    auto sink = std::make_unique<MemorySink>();
    auto lines = sink->lines();
    MetricsCollector metrics(std::move(sink));
    for (const auto& decision : outcome->decisions) {
        metrics.record_assignment(decision);
    }
    for (const auto& gap : coverage_gaps(outcome->schedule)) {
        metrics.record_coverage_gap(gap);
    }
    metrics.record_outcome(*outcome, store.size());

    ASSERT_EQ(lines->size(), 25u + 14u + 1u);
    EXPECT_EQ(lines->front(),
              R"({"event":"assignment","employee":"Alice","day":"Monday","shift":"Morning","reason":"preference"})");
    EXPECT_NE(lines->back().find(R"("event":"roster_summary")"), std::string::npos);
    EXPECT_NE(lines->back().find(R"("policy":"three_pass_greedy")"), std::string::npos);
    EXPECT_NE(lines->back().find(R"("assignments":25)"), std::string::npos);
    EXPECT_NE(lines->back().find(R"("coverage_gaps":14)"), std::string::npos);

    auto text = format_schedule(*outcome, store);
    EXPECT_NE(text.find("  Morning      : Alice, Bob\n"), std::string::npos);
    EXPECT_NE(text.find("  Erin                 : 5 days\n"), std::string::npos);
}
