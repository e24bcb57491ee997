#include <gtest/gtest.h>
#include <unordered_set>
#include "tax_ngin/core/date.hpp"

using namespace tax_ngin;

class DateTest : public ::testing::Test {};

TEST_F(DateTest, ParsesAcceptedFormats) {
    const Date expected(2020, 1, 15);
    for (const char* text :
         {"15-Jan-20", "15-January-20", "15 January 2020", "15 Jan 2020", "15-Jan-2020",
          "15-JAN-2020", "2020-01-15", "15/01/2020", "  15-Jan-20  "}) {
        auto parsed = Date::parse(text);
        ASSERT_TRUE(parsed.is_ok()) << text;
        EXPECT_EQ(parsed.value(), expected) << text;
    }
}

TEST_F(DateTest, SlashFormatFallsBackToMonthFirst) {
    auto parsed = Date::parse("01/13/2021");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), Date(2021, 1, 13));

    // Day first when both readings are possible
    EXPECT_EQ(Date::parse("02/03/2021").value(), Date(2021, 3, 2));
}

TEST_F(DateTest, TwoDigitYearPivot) {
    EXPECT_EQ(Date::parse("01-Nov-01").value().year, 2001);
    EXPECT_EQ(Date::parse("01-Nov-68").value().year, 2068);
    EXPECT_EQ(Date::parse("01-Nov-69").value().year, 1969);
    EXPECT_EQ(Date::parse("01-Nov-99").value().year, 1999);
}

TEST_F(DateTest, RejectsInvalidDates) {
    for (const char* text : {"", "31-Feb-21", "2021-13-01", "yesterday", "15-Jnu-20",
                             "29-Feb-2021", "15/15/2020"}) {
        auto parsed = Date::parse(text);
        ASSERT_TRUE(parsed.is_error()) << text;
        EXPECT_EQ(parsed.error()->code(), ErrorCode::CONVERSION_ERROR) << text;
    }
}

TEST_F(DateTest, LeapYears) {
    EXPECT_TRUE(is_leap_year(2020));
    EXPECT_TRUE(is_leap_year(2000));
    EXPECT_FALSE(is_leap_year(1900));
    EXPECT_FALSE(is_leap_year(2021));
    EXPECT_EQ(days_in_month(2020, 2), 29);
    EXPECT_EQ(days_in_month(2021, 2), 28);
    EXPECT_TRUE(Date::parse("29-Feb-2020").is_ok());
}

TEST_F(DateTest, AddYearsClampsLeapDay) {
    EXPECT_EQ(Date(2020, 1, 15).add_years(1), Date(2021, 1, 15));
    EXPECT_EQ(Date(2020, 2, 29).add_years(1), Date(2021, 2, 28));
    EXPECT_EQ(Date(2020, 2, 29).add_years(4), Date(2024, 2, 29));
}

TEST_F(DateTest, Ordering) {
    EXPECT_LT(Date(2020, 12, 31), Date(2021, 1, 1));
    EXPECT_LT(Date(2021, 1, 14), Date(2021, 1, 15));
    EXPECT_GE(Date(2021, 1, 15), Date(2021, 1, 15));
    EXPECT_NE(Date(2021, 1, 15), Date(2021, 2, 15));
}

TEST_F(DateTest, DaysSinceEpoch) {
    EXPECT_EQ(Date(1970, 1, 1).days_since_epoch(), 0);
    EXPECT_EQ(Date(2000, 3, 1).days_since_epoch(), 11017);
    EXPECT_EQ(Date(2021, 1, 15).days_since_epoch() - Date(2020, 1, 15).days_since_epoch(), 366);
}

TEST_F(DateTest, Formatting) {
    Date d(2020, 1, 5);
    EXPECT_EQ(d.to_short_string(), "05-Jan-20");
    EXPECT_EQ(d.to_iso_string(), "2020-01-05");
    EXPECT_EQ(d.month_key(), "2020-01");
}

TEST_F(DateTest, Hashable) {
    std::unordered_set<Date> dates{Date(2020, 1, 1), Date(2020, 1, 1), Date(2020, 1, 2)};
    EXPECT_EQ(dates.size(), 2u);
}
