/**
 * @file test_schedule_printer.cpp
 * @brief Unit tests for schedule rendering.
 */

#include "display/schedule_printer.hpp"
#include "scheduler/shift_assigner.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace shift_roster;

namespace {

class SchedulePrinterTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Registered out of alphabetical order on purpose
        store_.add_employee("Bob", PreferencePlan{}.set(Day::Monday, {ShiftKind::Morning}));
        store_.add_employee("Alice", PreferencePlan{}.set(Day::Monday, {ShiftKind::Morning}));
        auto outcome = ShiftAssigner(store_).run();
        ASSERT_TRUE(outcome.has_value());
        outcome_ = std::move(*outcome);
    }

    PreferenceStore store_;
    RosterOutcome outcome_;
};

}  // namespace

TEST(CenterTest, PadsBothSides) {
    EXPECT_EQ(center("ab", 6), "  ab  ");
    EXPECT_EQ(center("abc", 6), " abc  ");
    EXPECT_EQ(center("toolong", 3), "toolong");
}

TEST_F(SchedulePrinterTest, RendersGridInWeekOrder) {
    auto text = format_schedule(outcome_, store_);

    EXPECT_NE(text.find(std::string(80, '=')), std::string::npos);
    EXPECT_NE(text.find(center("EMPLOYEE SCHEDULE FOR THE WEEK", 80)), std::string::npos);
    EXPECT_NE(text.find("\nMONDAY\n" + std::string(60, '-') + "\n"), std::string::npos);
    EXPECT_NE(text.find("  Morning      : Bob, Alice\n"), std::string::npos);
    EXPECT_NE(text.find("  Evening      : No employees assigned\n"), std::string::npos);

    auto monday = text.find("MONDAY");
    auto sunday = text.find("SUNDAY");
    ASSERT_NE(monday, std::string::npos);
    ASSERT_NE(sunday, std::string::npos);
    EXPECT_LT(monday, sunday);
}

TEST_F(SchedulePrinterTest, SummarySortedByName) {
    auto text = format_schedule(outcome_, store_);

    auto header = text.find("EMPLOYEE WORK SUMMARY");
    auto alice = text.find("  Alice                : 5 days\n");
    auto bob = text.find("  Bob                  : 5 days\n");
    ASSERT_NE(header, std::string::npos);
    ASSERT_NE(alice, std::string::npos);
    ASSERT_NE(bob, std::string::npos);
    EXPECT_LT(header, alice);
    EXPECT_LT(alice, bob);
}

TEST_F(SchedulePrinterTest, SummaryCanBeDisabled) {
    DisplayConfig display;
    display.show_summary = false;
    display.line_width = 60;

    auto text = format_schedule(outcome_, store_, display);
    EXPECT_EQ(text.find("EMPLOYEE WORK SUMMARY"), std::string::npos);
    EXPECT_EQ(text.find(std::string(61, '=')), std::string::npos);
    EXPECT_NE(text.find(std::string(60, '=')), std::string::npos);
}

TEST(SchedulePrinterEmptyTest, EveryShiftUnassigned) {
    PreferenceStore store;
    auto outcome = ShiftAssigner(store).run();
    ASSERT_TRUE(outcome.has_value());

    auto text = format_schedule(*outcome, store);
    std::size_t count = 0;
    for (auto pos = text.find("No employees assigned"); pos != std::string::npos;
         pos = text.find("No employees assigned", pos + 1)) {
        ++count;
    }
    EXPECT_EQ(count, kDayCount * kShiftCount);
}
