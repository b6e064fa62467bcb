// ==============================================================================
// test_datetime_gtest.cpp - Тесты RFC 3339 и UTC-календаря (GoogleTest)
// ==============================================================================

#include "warden/datetime.hpp"

#include <gtest/gtest.h>

namespace warden::datetime::test {

TEST(DatetimeTest, ParseRfc3339_Utc_ReturnsEpochMillis) {
    auto tp = parse_rfc3339("2024-01-15T10:00:00Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(unix_millis(*tp), 1705312800000);
}

TEST(DatetimeTest, ParseRfc3339_Offset_NormalizedToUtc) {
    auto utc = parse_rfc3339("2024-01-15T10:00:00Z");
    auto shifted = parse_rfc3339("2024-01-15T12:00:00+02:00");
    ASSERT_TRUE(utc && shifted);
    EXPECT_EQ(*utc, *shifted);
}

TEST(DatetimeTest, ParseRfc3339_FractionalSeconds_Kept) {
    auto tp = parse_rfc3339("2024-01-15T10:00:00.250Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(unix_millis(*tp), 1705312800250);
}

TEST(DatetimeTest, ParseRfc3339_Invalid_ReturnsNullopt) {
    EXPECT_FALSE(parse_rfc3339("not a date").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_rfc3339("2023-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-01-15T10:00:00Q").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-01-15T10:00:00.Z").has_value());
}

TEST(DatetimeTest, FormatRfc3339_MillisecondPrecision) {
    EXPECT_EQ(format_rfc3339(from_unix_millis(1705312800000)), "2024-01-15T10:00:00.000Z");
    EXPECT_EQ(format_rfc3339(from_unix_millis(1705312800042)), "2024-01-15T10:00:00.042Z");
}

TEST(DatetimeTest, FormatThenParse_SameInstant) {
    TimePoint tp = from_unix_millis(1718000000123);
    auto back = parse_rfc3339(format_rfc3339(tp));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(unix_millis(*back), 1718000000123);
}

TEST(DatetimeTest, WeekdayAndHour_Utc) {
    auto tp = parse_rfc3339("2024-01-15T10:30:00Z");  // понедельник
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(weekday_utc(*tp), 1);
    EXPECT_EQ(hour_utc(*tp), 10);

    auto sunday = parse_rfc3339("2024-01-14T23:59:59Z");
    ASSERT_TRUE(sunday.has_value());
    EXPECT_EQ(weekday_utc(*sunday), 0);
    EXPECT_EQ(hour_utc(*sunday), 23);
}

}  // namespace warden::datetime::test
