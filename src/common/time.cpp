#include "tasktide/common/time.hpp"

#include "tasktide/common/fs.hpp"

#include <array>
#include <cctype>
#include <charconv>

namespace tasktide::common {

namespace {

bool read_digits(const std::string &value, std::size_t &pos, std::size_t count, int &out) {
  if (pos + count > value.size()) {
    return false;
  }
  const char *first = value.data() + pos;
  auto [ptr, ec] = std::from_chars(first, first + count, out);
  if (ec != std::errc() || ptr != first + count) {
    return false;
  }
  pos += count;
  return true;
}

bool expect(const std::string &value, std::size_t &pos, char ch) {
  if (pos >= value.size() || value[pos] != ch) {
    return false;
  }
  ++pos;
  return true;
}

bool is_leap(int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

int days_in_month(int year, int month) {
  static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap(year)) {
    return 29;
  }
  return kDays[static_cast<std::size_t>(month - 1)];
}

std::time_t utc_timegm(std::tm *tm) {
#ifdef _WIN32
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}

} // namespace

std::int64_t to_unix_seconds(const TimePoint time_point) {
  return std::chrono::duration_cast<std::chrono::seconds>(time_point.time_since_epoch()).count();
}

TimePoint from_unix_seconds(const std::int64_t seconds) {
  return TimePoint(std::chrono::seconds(seconds));
}

std::tm local_tm(const TimePoint time_point) {
  const std::time_t time = Clock::to_time_t(time_point);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif
  return tm;
}

Result<TimePoint> from_local_tm(std::tm tm) {
  tm.tm_isdst = -1;
  const std::time_t time = std::mktime(&tm);
  if (time == static_cast<std::time_t>(-1)) {
    return Result<TimePoint>::failure("local time is not representable");
  }
  return Result<TimePoint>::success(Clock::from_time_t(time));
}

Result<TimePoint> parse_iso8601(const std::string &raw) {
  const std::string value = trim(raw);
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  if (!read_digits(value, pos, 4, year) || !expect(value, pos, '-') ||
      !read_digits(value, pos, 2, month) || !expect(value, pos, '-') ||
      !read_digits(value, pos, 2, day)) {
    return Result<TimePoint>::failure("invalid ISO-8601 date: " + value);
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  if (pos < value.size() && (value[pos] == 'T' || value[pos] == 't' || value[pos] == ' ')) {
    ++pos;
    if (!read_digits(value, pos, 2, hour) || !expect(value, pos, ':') ||
        !read_digits(value, pos, 2, minute)) {
      return Result<TimePoint>::failure("invalid ISO-8601 time: " + value);
    }
    if (pos < value.size() && value[pos] == ':') {
      ++pos;
      if (!read_digits(value, pos, 2, second)) {
        return Result<TimePoint>::failure("invalid ISO-8601 seconds: " + value);
      }
      if (pos < value.size() && value[pos] == '.') {
        ++pos;
        const std::size_t fraction_start = pos;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])) != 0) {
          ++pos;
        }
        if (pos == fraction_start) {
          return Result<TimePoint>::failure("invalid ISO-8601 fraction: " + value);
        }
      }
    }
  }

  bool has_offset = false;
  int offset_seconds = 0;
  if (pos < value.size()) {
    const char marker = value[pos];
    if (marker == 'Z' || marker == 'z') {
      has_offset = true;
      ++pos;
    } else if (marker == '+' || marker == '-') {
      ++pos;
      int offset_hours = 0;
      int offset_minutes = 0;
      if (!read_digits(value, pos, 2, offset_hours)) {
        return Result<TimePoint>::failure("invalid ISO-8601 offset: " + value);
      }
      if (pos < value.size() && value[pos] == ':') {
        ++pos;
      }
      if (!read_digits(value, pos, 2, offset_minutes) || offset_hours > 23 ||
          offset_minutes > 59) {
        return Result<TimePoint>::failure("invalid ISO-8601 offset: " + value);
      }
      has_offset = true;
      offset_seconds = (offset_hours * 3600 + offset_minutes * 60) * (marker == '-' ? -1 : 1);
    }
  }
  if (pos != value.size()) {
    return Result<TimePoint>::failure("unexpected trailing characters in ISO-8601: " + value);
  }

  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 ||
      minute > 59 || second > 59) {
    return Result<TimePoint>::failure("ISO-8601 field out of range: " + value);
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;

  if (!has_offset) {
    return from_local_tm(tm);
  }

  const std::time_t utc = utc_timegm(&tm);
  if (utc == static_cast<std::time_t>(-1)) {
    return Result<TimePoint>::failure("ISO-8601 instant is not representable: " + value);
  }
  return Result<TimePoint>::success(Clock::from_time_t(utc) - std::chrono::seconds(offset_seconds));
}

std::string format_iso8601(const TimePoint time_point) {
  return format_local(time_point, "%Y-%m-%dT%H:%M:%S");
}

std::string format_local(const TimePoint time_point, const char *format) {
  const std::tm tm = local_tm(time_point);
  std::array<char, 128> buffer{};
  const std::size_t written = std::strftime(buffer.data(), buffer.size(), format, &tm);
  return std::string(buffer.data(), written);
}

} // namespace tasktide::common
