#pragma once

#include "tasktide/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace tasktide::common {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

[[nodiscard]] std::int64_t to_unix_seconds(TimePoint time_point);
[[nodiscard]] TimePoint from_unix_seconds(std::int64_t seconds);

/// Broken-down local time for the given instant (process TZ).
[[nodiscard]] std::tm local_tm(TimePoint time_point);

/// Convert a broken-down local time back to an instant; mktime normalizes overflowing fields.
[[nodiscard]] Result<TimePoint> from_local_tm(std::tm tm);

/// Parses `YYYY-MM-DD[(T| )HH:MM[:SS[.fff]]][Z|+HH:MM|-HH:MM|+HHMM]`.
/// Instants without an offset are interpreted as local time.
[[nodiscard]] Result<TimePoint> parse_iso8601(const std::string &value);

/// Local naive ISO-8601 (`YYYY-MM-DDTHH:MM:SS`).
[[nodiscard]] std::string format_iso8601(TimePoint time_point);

/// strftime over local time.
[[nodiscard]] std::string format_local(TimePoint time_point, const char *format);

} // namespace tasktide::common
