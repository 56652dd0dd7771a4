#ifndef GISTVAULT_TIME_HPP
#define GISTVAULT_TIME_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace gistvault::utils {

using TimePoint = std::chrono::system_clock::time_point;
// Clock source, replaceable in tests
using Clock = std::function<TimePoint()>;

TimePoint system_now();

enum class ExpiryOption {
  Never,
  OneHour,
  TwentyFourHours,
  SevenDays,
  ThirtyDays
};

// ---- ISO-8601 ----
// Formats as YYYY-MM-DDTHH:MM:SS.mmmZ (UTC)
std::string format_iso8601(TimePoint time);
// Accepts YYYY-MM-DDTHH:MM:SS[.fff]Z, throws std::invalid_argument otherwise
TimePoint parse_iso8601(const std::string& text);


// ---- EXPIRY ----
// Returns nullopt for ExpiryOption::Never
std::optional<TimePoint> expiry_from(TimePoint now, ExpiryOption option);
// Parses never|1hour|24hours|7days|30days
ExpiryOption parse_expiry_option(const std::string& text);

uint64_t to_unix_millis(TimePoint time);

} // namespace gistvault::utils

#endif // GISTVAULT_TIME_HPP
