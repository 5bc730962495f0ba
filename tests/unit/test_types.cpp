/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace shift_roster;

TEST(DayTest, WeekOrder) {
    ASSERT_EQ(kWeek.size(), 7u);
    EXPECT_EQ(kWeek.front(), Day::Monday);
    EXPECT_EQ(kWeek.back(), Day::Sunday);
    for (std::size_t i = 0; i < kWeek.size(); ++i) {
        EXPECT_EQ(index_of(kWeek[i]), i);
    }
}

TEST(DayTest, ToString) {
    EXPECT_EQ(to_string(Day::Monday), "Monday");
    EXPECT_EQ(to_string(Day::Wednesday), "Wednesday");
    EXPECT_EQ(to_string(Day::Sunday), "Sunday");
}

TEST(DayTest, ParseIgnoresCaseAndWhitespace) {
    EXPECT_EQ(*parse_day("Monday"), Day::Monday);
    EXPECT_EQ(*parse_day("friday"), Day::Friday);
    EXPECT_EQ(*parse_day("  SATURDAY "), Day::Saturday);
}

TEST(DayTest, ParseRejectsUnknownName) {
    auto result = parse_day("Funday");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
    EXPECT_NE(result.error().message.find("Funday"), std::string::npos);

    EXPECT_FALSE(parse_day("").has_value());
    EXPECT_FALSE(parse_day("Mon").has_value());
}

TEST(ShiftKindTest, Order) {
    ASSERT_EQ(kShifts.size(), 3u);
    EXPECT_EQ(kShifts[0], ShiftKind::Morning);
    EXPECT_EQ(kShifts[1], ShiftKind::Afternoon);
    EXPECT_EQ(kShifts[2], ShiftKind::Evening);
}

TEST(ShiftKindTest, Parse) {
    EXPECT_EQ(*parse_shift_kind("Morning"), ShiftKind::Morning);
    EXPECT_EQ(*parse_shift_kind("afternoon"), ShiftKind::Afternoon);
    EXPECT_EQ(*parse_shift_kind(" EVENING\t"), ShiftKind::Evening);
    EXPECT_FALSE(parse_shift_kind("Night").has_value());
}

TEST(ConstantsTest, StaffingLimits) {
    EXPECT_EQ(kMinEmployeesPerShift, 2u);
    EXPECT_EQ(kMaxDaysPerWeek, 5u);
    EXPECT_EQ(kMaxRankedShifts, 3u);
}

TEST(TrimTest, StripsBothEnds) {
    EXPECT_EQ(trim("  a b \n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("x"), "x");
}
