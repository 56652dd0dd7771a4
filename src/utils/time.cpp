#include "utils/time.hpp"
#include <cstdio>
#include <stdexcept>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace gistvault::utils {

namespace bpt = boost::posix_time;
namespace greg = boost::gregorian;

namespace {

const bpt::ptime EPOCH(greg::date(1970, 1, 1));

} // namespace

TimePoint system_now() {
  return std::chrono::system_clock::now();
}


//==============================================
// ISO-8601
//==============================================

std::string format_iso8601(TimePoint time) {
  const int64_t millis = std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()).count();
  const bpt::ptime moment = EPOCH + bpt::milliseconds(millis);
  const bpt::time_duration day_time = moment.time_of_day();

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%sT%02d:%02d:%02d.%03dZ",
                greg::to_iso_extended_string(moment.date()).c_str(),
                static_cast<int>(day_time.hours()), static_cast<int>(day_time.minutes()),
                static_cast<int>(day_time.seconds()),
                static_cast<int>(day_time.total_milliseconds() % 1000));
  return buffer;
}

TimePoint parse_iso8601(const std::string& text) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  int consumed = 0;

  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                  &year, &month, &day, &hour, &minute, &second, &consumed) != 6 ||
      consumed != 19) {
    throw std::invalid_argument("Malformed ISO-8601 timestamp: " + text);
  }

  // Optional fractional seconds, truncated to milliseconds
  size_t pos = 19;
  int millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      throw std::invalid_argument("Malformed ISO-8601 fraction: " + text);
    }
    for (size_t i = digits; i < 3; ++i) {
      millis *= 10;
    }
  }

  if (pos + 1 != text.size() || text[pos] != 'Z') {
    throw std::invalid_argument("ISO-8601 timestamp must end in Z: " + text);
  }
  if (hour > 23 || minute > 59 || second > 59) {
    throw std::invalid_argument("ISO-8601 field out of range: " + text);
  }

  bpt::ptime moment;
  try {
    // Rejects month 13, February 30th and the like
    moment = bpt::ptime(greg::date(year, month, day),
                        bpt::hours(hour) + bpt::minutes(minute) + bpt::seconds(second) +
                            bpt::milliseconds(millis));
  } catch (const std::out_of_range& e) {
    throw std::invalid_argument("ISO-8601 field out of range: " + text + " (" + e.what() + ")");
  }

  const int64_t total_ms = (moment - EPOCH).total_milliseconds();
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
      std::chrono::milliseconds(total_ms)));
}


//==============================================
// EXPIRY
//==============================================

std::optional<TimePoint> expiry_from(TimePoint now, ExpiryOption option) {
  using std::chrono::hours;
  switch (option) {
    case ExpiryOption::Never: return std::nullopt;
    case ExpiryOption::OneHour: return now + hours(1);
    case ExpiryOption::TwentyFourHours: return now + hours(24);
    case ExpiryOption::SevenDays: return now + hours(24 * 7);
    case ExpiryOption::ThirtyDays: return now + hours(24 * 30);
  }
  return std::nullopt;
}

ExpiryOption parse_expiry_option(const std::string& text) {
  if (text == "never") return ExpiryOption::Never;
  if (text == "1hour") return ExpiryOption::OneHour;
  if (text == "24hours") return ExpiryOption::TwentyFourHours;
  if (text == "7days") return ExpiryOption::SevenDays;
  if (text == "30days") return ExpiryOption::ThirtyDays;
  throw std::invalid_argument("Unknown expiry option: " + text);
}

uint64_t to_unix_millis(TimePoint time) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()).count());
}

} // namespace gistvault::utils
