#include <gtest/gtest.h>
#include "util/timestamp.hpp"

#include <limits>

using namespace cuisine::util;

TEST(TimestampTest, ParsesFullIsoWithZulu) {
    const auto ts = parseIsoTimestamp("2024-03-01T08:15:30.250Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(toEpochMs(*ts), 1709280930250);
}

TEST(TimestampTest, DateOnlyIsUtcMidnight) {
    const auto ts = parseIsoTimestamp("2024-03-01");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(timestampToIso(*ts), "2024-03-01T00:00:00.000Z");
}

TEST(TimestampTest, YearAndYearMonthForms) {
    EXPECT_EQ(timestampToIso(*parseIsoTimestamp("2024")), "2024-01-01T00:00:00.000Z");
    EXPECT_EQ(timestampToIso(*parseIsoTimestamp("2024-07")), "2024-07-01T00:00:00.000Z");
}

TEST(TimestampTest, OffsetIsApplied) {
    const auto ts = parseIsoTimestamp("2024-03-01T10:00:00+02:00");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(timestampToIso(*ts), "2024-03-01T08:00:00.000Z");

    const auto compact = parseIsoTimestamp("2024-03-01T10:00:00+0200");
    ASSERT_TRUE(compact.has_value());
    EXPECT_EQ(*compact, *ts);
}

TEST(TimestampTest, SpaceSeparatorAndMissingSeconds) {
    EXPECT_EQ(timestampToIso(*parseIsoTimestamp("2024-03-01 08:15:00")), "2024-03-01T08:15:00.000Z");
    EXPECT_EQ(timestampToIso(*parseIsoTimestamp("2024-03-01T08:15")), "2024-03-01T08:15:00.000Z");
}

TEST(TimestampTest, FractionBeyondMillisecondsIsTruncated) {
    EXPECT_EQ(timestampToIso(*parseIsoTimestamp("2024-03-01T08:15:00.123456Z")), "2024-03-01T08:15:00.123Z");
    EXPECT_EQ(timestampToIso(*parseIsoTimestamp("2024-03-01T08:15:00.5Z")), "2024-03-01T08:15:00.500Z");
}

TEST(TimestampTest, RejectsCalendarInvalidDates) {
    EXPECT_FALSE(parseIsoTimestamp("2024-02-30").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2023-02-29").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-13-01").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-00-10").has_value());
    EXPECT_TRUE(parseIsoTimestamp("2024-02-29").has_value());
}

TEST(TimestampTest, RejectsGarbage) {
    EXPECT_FALSE(parseIsoTimestamp("").has_value());
    EXPECT_FALSE(parseIsoTimestamp("not a date").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-03-01T25:00").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-03-01T08:60").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-03-01T08:15:00Zjunk").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-03T08:00").has_value());
}

TEST(TimestampTest, MidnightAsTwentyFour) {
    const auto ts = parseIsoTimestamp("2024-03-01T24:00:00Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(timestampToIso(*ts), "2024-03-02T00:00:00.000Z");
    EXPECT_FALSE(parseIsoTimestamp("2024-03-01T24:00:01Z").has_value());
}

TEST(TimestampTest, EpochMillisecondsRange) {
    EXPECT_EQ(timestampToIso(*timestampFromEpochMs(0)), "1970-01-01T00:00:00.000Z");
    EXPECT_TRUE(timestampFromEpochMs(8.64e15).has_value());
    EXPECT_FALSE(timestampFromEpochMs(8.64e15 + 1).has_value());
    EXPECT_FALSE(timestampFromEpochMs(std::numeric_limits<double>::infinity()).has_value());
    EXPECT_FALSE(timestampFromEpochMs(std::numeric_limits<double>::quiet_NaN()).has_value());
}

TEST(TimestampTest, NegativeEpochFormatsBeforeUnixEpoch) {
    EXPECT_EQ(timestampToIso(*timestampFromEpochMs(-1)), "1969-12-31T23:59:59.999Z");
}

TEST(TimestampTest, ExtendedYearsRoundTrip) {
    const auto ts = timestampFromEpochMs(8.64e15);
    ASSERT_TRUE(ts.has_value());
    const auto iso = timestampToIso(*ts);
    EXPECT_EQ(iso, "+275760-09-13T00:00:00.000Z");
    EXPECT_EQ(parseIsoTimestamp(iso), ts);
}

TEST(TimestampTest, DateString) {
    EXPECT_EQ(dateString(*parseIsoTimestamp("2024-03-01T23:59:59.999Z")), "2024-03-01");
}
