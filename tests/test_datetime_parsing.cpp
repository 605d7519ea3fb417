#include "DateTimeParsing.h"

#include <gtest/gtest.h>

using DateTimeParsing::DateLocaleHint;
using DateTimeParsing::parseDateTime;

namespace {
constexpr int64_t kJan15_2024 = 1705276800; // 2024-01-15T00:00:00Z
constexpr int64_t kHalfPastTen = 10 * 3600 + 30 * 60;
} // namespace

TEST(DateTimeParsingTest, IsoDateAndTimestamp) {
    EXPECT_EQ(parseDateTime("2024-01-15"), kJan15_2024);
    EXPECT_EQ(parseDateTime("2024/01/15"), kJan15_2024);
    EXPECT_EQ(parseDateTime("2024-01-15T10:30:00Z"), kJan15_2024 + kHalfPastTen);
    EXPECT_EQ(parseDateTime("2024-01-15 10:30:00.250"), kJan15_2024 + kHalfPastTen);
}

TEST(DateTimeParsingTest, OffsetsShiftToUtc) {
    EXPECT_EQ(parseDateTime("2024-01-15 10:30:00 +02:00"), kJan15_2024 + kHalfPastTen - 7200);
    EXPECT_EQ(parseDateTime("2024-01-15T10:30:00-0100"), kJan15_2024 + kHalfPastTen + 3600);
}

TEST(DateTimeParsingTest, TwelveHourClock) {
    EXPECT_EQ(parseDateTime("2024-01-15 10:30 PM"), kJan15_2024 + kHalfPastTen + 12 * 3600);
    EXPECT_EQ(parseDateTime("2024-01-15 12:00 am"), kJan15_2024);
}

TEST(DateTimeParsingTest, SlashDatesFollowLocaleHint) {
    // Unambiguous: the first field cannot be a month.
    EXPECT_EQ(parseDateTime("15/01/2024"), kJan15_2024);

    const int64_t jan2 = kJan15_2024 - 13 * 86400;
    const int64_t feb1 = kJan15_2024 + 17 * 86400;
    EXPECT_EQ(parseDateTime("01/02/2024", DateLocaleHint::AUTO), jan2);
    EXPECT_EQ(parseDateTime("01/02/2024", DateLocaleHint::MDY), jan2);
    EXPECT_EQ(parseDateTime("01/02/2024", DateLocaleHint::DMY), feb1);
    EXPECT_EQ(parseDateTime("15.01.2024"), kJan15_2024);
}

TEST(DateTimeParsingTest, MonthNames) {
    EXPECT_EQ(parseDateTime("Jan 15, 2024"), kJan15_2024);
    EXPECT_EQ(parseDateTime("15 January 2024"), kJan15_2024);
    EXPECT_EQ(parseDateTime("15th Jan 2024"), kJan15_2024);
    EXPECT_EQ(parseDateTime("January 15 2024"), kJan15_2024);
}

TEST(DateTimeParsingTest, TwoDigitYearAndIsoWeek) {
    EXPECT_EQ(parseDateTime("01-15-24"), kJan15_2024);
    EXPECT_EQ(parseDateTime("2024-W03-1"), kJan15_2024);
}

TEST(DateTimeParsingTest, RejectsInvalidCalendarDates) {
    EXPECT_FALSE(parseDateTime("2024-02-30").has_value());
    EXPECT_FALSE(parseDateTime("2023-02-29").has_value());
    EXPECT_TRUE(parseDateTime("2024-02-29").has_value());
    EXPECT_FALSE(parseDateTime("2024-13-01").has_value());
    EXPECT_FALSE(parseDateTime("2024-01-15 25:00").has_value());
}

TEST(DateTimeParsingTest, NumbersAreNeverDates) {
    EXPECT_FALSE(DateTimeParsing::isDateTime("20240115"));
    EXPECT_FALSE(DateTimeParsing::isDateTime("12345.67"));
    EXPECT_FALSE(DateTimeParsing::isDateTime("-1e10"));
    EXPECT_FALSE(DateTimeParsing::isDateTime("hello world"));
    EXPECT_FALSE(DateTimeParsing::isDateTime(""));
}

TEST(DateTimeParsingTest, FormatIso8601) {
    EXPECT_EQ(DateTimeParsing::formatIso8601(0), "1970-01-01T00:00:00");
    EXPECT_EQ(DateTimeParsing::formatIso8601(-1), "1969-12-31T23:59:59");
    EXPECT_EQ(DateTimeParsing::formatIso8601(kJan15_2024 + kHalfPastTen), "2024-01-15T10:30:00");
}

TEST(DateTimeParsingTest, FormattedTimestampsParseBack) {
    const int64_t ts = kJan15_2024 + kHalfPastTen + 59;
    EXPECT_EQ(parseDateTime(DateTimeParsing::formatIso8601(ts)), ts);
}

TEST(DateTimeParsingTest, DatePatternScreen) {
    EXPECT_TRUE(DateTimeParsing::matchesDatePattern("2024-01-15"));
    EXPECT_TRUE(DateTimeParsing::matchesDatePattern("15/01/24"));
    EXPECT_TRUE(DateTimeParsing::matchesDatePattern("15 January 2024"));
    EXPECT_TRUE(DateTimeParsing::matchesDatePattern("Jan 15, 2024"));
    EXPECT_FALSE(DateTimeParsing::matchesDatePattern("order-15"));
    EXPECT_FALSE(DateTimeParsing::matchesDatePattern(""));
}

TEST(DateTimeParsingTest, LocaleHintNames) {
    EXPECT_EQ(DateTimeParsing::parseLocaleHint("DMY").value(), DateLocaleHint::DMY);
    EXPECT_EQ(DateTimeParsing::parseLocaleHint(" mdy ").value(), DateLocaleHint::MDY);
    EXPECT_EQ(DateTimeParsing::parseLocaleHint("auto").value(), DateLocaleHint::AUTO);
    EXPECT_FALSE(DateTimeParsing::parseLocaleHint("ymd").has_value());
    EXPECT_STREQ(DateTimeParsing::toString(DateLocaleHint::DMY), "dmy");
}
