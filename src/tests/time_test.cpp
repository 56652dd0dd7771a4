#include <gtest/gtest.h>
#include "utils/time.hpp"
#include <stdexcept>

using namespace gistvault::utils;
using std::chrono::hours;
using std::chrono::milliseconds;

TEST(TimeTest, FormatsEpochWithMilliseconds) {
  EXPECT_EQ(format_iso8601(TimePoint{}), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(format_iso8601(TimePoint{} + milliseconds(1749290400123LL)),
            "2025-06-07T10:00:00.123Z");
}

TEST(TimeTest, FormatsAcrossDayAndLeapBoundaries) {
  EXPECT_EQ(format_iso8601(TimePoint{} - milliseconds(1)), "1969-12-31T23:59:59.999Z");
  EXPECT_EQ(format_iso8601(parse_iso8601("2024-02-28T23:59:59.999Z") + milliseconds(1)),
            "2024-02-29T00:00:00.000Z");
  EXPECT_EQ(format_iso8601(parse_iso8601("2025-02-28T23:59:59.999Z") + milliseconds(1)),
            "2025-03-01T00:00:00.000Z");
}

TEST(TimeTest, ParsesWhatItFormats) {
  const std::string text = "2024-02-29T23:59:59.999Z";
  EXPECT_EQ(format_iso8601(parse_iso8601(text)), text);
}

TEST(TimeTest, ParsesWithoutFraction) {
  EXPECT_EQ(to_unix_millis(parse_iso8601("2025-06-07T10:00:00Z")), 1749290400000ULL);
  EXPECT_EQ(to_unix_millis(parse_iso8601("2025-06-07T10:00:00.5Z")), 1749290400500ULL);
  EXPECT_EQ(to_unix_millis(parse_iso8601("2025-06-07T10:00:00.123456Z")), 1749290400123ULL);
}

TEST(TimeTest, RejectsMalformedTimestamps) {
  EXPECT_THROW(parse_iso8601(""), std::invalid_argument);
  EXPECT_THROW(parse_iso8601("yesterday"), std::invalid_argument);
  EXPECT_THROW(parse_iso8601("2025-06-07 10:00:00Z"), std::invalid_argument);
  EXPECT_THROW(parse_iso8601("2025-06-07T10:00:00.000"), std::invalid_argument);
  EXPECT_THROW(parse_iso8601("2025-06-07T10:00:00.Z"), std::invalid_argument);
  EXPECT_THROW(parse_iso8601("2025-02-30T10:00:00Z"), std::invalid_argument);
  EXPECT_THROW(parse_iso8601("2025-13-01T10:00:00Z"), std::invalid_argument);
  EXPECT_THROW(parse_iso8601("2025-06-07T10:00:00.000Z+"), std::invalid_argument);
}

TEST(TimeTest, ExpiryOptions) {
  const TimePoint now = parse_iso8601("2025-06-07T10:00:00.000Z");

  EXPECT_FALSE(expiry_from(now, ExpiryOption::Never).has_value());
  EXPECT_EQ(*expiry_from(now, ExpiryOption::OneHour), now + hours(1));
  EXPECT_EQ(format_iso8601(*expiry_from(now, ExpiryOption::TwentyFourHours)),
            "2025-06-08T10:00:00.000Z");
  EXPECT_EQ(format_iso8601(*expiry_from(now, ExpiryOption::SevenDays)),
            "2025-06-14T10:00:00.000Z");
  EXPECT_EQ(format_iso8601(*expiry_from(now, ExpiryOption::ThirtyDays)),
            "2025-07-07T10:00:00.000Z");
}

TEST(TimeTest, ParsesExpiryOptionNames) {
  EXPECT_EQ(parse_expiry_option("never"), ExpiryOption::Never);
  EXPECT_EQ(parse_expiry_option("1hour"), ExpiryOption::OneHour);
  EXPECT_EQ(parse_expiry_option("24hours"), ExpiryOption::TwentyFourHours);
  EXPECT_EQ(parse_expiry_option("7days"), ExpiryOption::SevenDays);
  EXPECT_EQ(parse_expiry_option("30days"), ExpiryOption::ThirtyDays);
  EXPECT_THROW(parse_expiry_option("forever"), std::invalid_argument);
}

TEST(TimeTest, FormattedTimestampsSortChronologically) {
  const TimePoint earlier = parse_iso8601("2025-06-07T09:59:59.999Z");
  const TimePoint later = earlier + milliseconds(1);
  EXPECT_LT(format_iso8601(earlier), format_iso8601(later));
}
