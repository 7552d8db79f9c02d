#include "tasktide/scheduler/cron.hpp"

#include "tasktide/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace tasktide::scheduler {

namespace {

// Long enough for a Feb 29 + weekday combination to come around again.
constexpr int kSearchYears = 28;

constexpr std::array<const char *, 5> kFieldNames = {"minute", "hour", "day", "month",
                                                     "day_of_week"};

common::Result<int> parse_int(const std::string &value) {
  int parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
    return common::Result<int>::failure("invalid integer: '" + value + "'");
  }
  return common::Result<int>::success(parsed);
}

bool has(const std::vector<bool> &allowed, const int value) {
  return value >= 0 && static_cast<std::size_t>(value) < allowed.size() &&
         allowed[static_cast<std::size_t>(value)];
}

} // namespace

common::Result<CronExpression> CronExpression::parse(std::string_view expression_view) {
  const auto parts = common::split_whitespace(std::string(expression_view));
  if (parts.size() != 5) {
    return common::Result<CronExpression>::failure("cron expression must have 5 fields, got " +
                                                   std::to_string(parts.size()));
  }

  static constexpr std::array<std::pair<int, int>, 5> kBounds = {
      std::pair{0, 59}, std::pair{0, 23}, std::pair{1, 31}, std::pair{1, 12}, std::pair{0, 6}};

  CronExpression expression;
  std::array<std::vector<bool> *, 5> targets = {&expression.minutes_, &expression.hours_,
                                                &expression.days_, &expression.months_,
                                                &expression.weekdays_};
  for (std::size_t i = 0; i < parts.size(); ++i) {
    auto field = parse_field(parts[i], kBounds[i].first, kBounds[i].second);
    if (!field.ok()) {
      return common::Result<CronExpression>::failure(std::string(kFieldNames[i]) + ": " +
                                                     field.error());
    }
    *targets[i] = std::move(field.value());
    expression.fields_[i] = parts[i];
  }
  return common::Result<CronExpression>::success(std::move(expression));
}

common::Result<std::vector<bool>> CronExpression::parse_field(std::string_view field_view,
                                                              const int min, const int max) {
  const std::string field(field_view);
  std::vector<bool> allowed(static_cast<std::size_t>(max) + 1, false);

  auto add_range = [&](int start, int end, int step) -> common::Status {
    if (start > end) {
      return common::Status::error("range start exceeds end in '" + field + "'");
    }
    if (start < min || end > max) {
      return common::Status::error("value out of bounds " + std::to_string(min) + "-" +
                                   std::to_string(max) + " in '" + field + "'");
    }
    for (int value = start; value <= end; value += step) {
      allowed[static_cast<std::size_t>(value)] = true;
    }
    return common::Status::success();
  };

  if (field == "*") {
    (void)add_range(min, max, 1);
    return common::Result<std::vector<bool>>::success(std::move(allowed));
  }

  if (common::starts_with(field, "*/")) {
    auto step = parse_int(field.substr(2));
    if (!step.ok()) {
      return common::Result<std::vector<bool>>::failure(step.error());
    }
    if (step.value() <= 0) {
      return common::Result<std::vector<bool>>::failure("step must be positive in '" + field +
                                                        "'");
    }
    (void)add_range(min, max, step.value());
    return common::Result<std::vector<bool>>::success(std::move(allowed));
  }

  std::stringstream parts(field);
  std::string segment;
  bool any = false;
  while (std::getline(parts, segment, ',')) {
    if (segment.empty()) {
      return common::Result<std::vector<bool>>::failure("empty list element in '" + field + "'");
    }

    int start = 0;
    int end = 0;
    const auto dash = segment.find('-');
    if (dash != std::string::npos) {
      auto left = parse_int(segment.substr(0, dash));
      auto right = parse_int(segment.substr(dash + 1));
      if (!left.ok() || !right.ok()) {
        return common::Result<std::vector<bool>>::failure("invalid range '" + segment + "'");
      }
      start = left.value();
      end = right.value();
    } else {
      auto value = parse_int(segment);
      if (!value.ok()) {
        return common::Result<std::vector<bool>>::failure(value.error());
      }
      start = end = value.value();
    }

    auto status = add_range(start, end, 1);
    if (!status.ok()) {
      return common::Result<std::vector<bool>>::failure(status.error());
    }
    any = true;
  }

  if (!any) {
    return common::Result<std::vector<bool>>::failure("no values in field");
  }
  return common::Result<std::vector<bool>>::success(std::move(allowed));
}

bool CronExpression::matches(const std::tm &time) const {
  return has(minutes_, time.tm_min) && has(hours_, time.tm_hour) && has(days_, time.tm_mday) &&
         has(months_, time.tm_mon + 1) && has(weekdays_, time.tm_wday);
}

std::optional<common::TimePoint> CronExpression::next_occurrence(common::TimePoint after) const {
  auto candidate =
      std::chrono::time_point_cast<std::chrono::minutes>(after) + std::chrono::minutes(1);
  if (candidate <= after) {
    candidate += std::chrono::minutes(1);
  }
  const auto limit = candidate + std::chrono::hours(24 * 366 * kSearchYears);

  while (candidate < limit) {
    std::tm tm = common::local_tm(candidate);
    bool jumped = true;
    if (!has(months_, tm.tm_mon + 1)) {
      tm.tm_mon += 1;
      tm.tm_mday = 1;
      tm.tm_hour = 0;
      tm.tm_min = 0;
    } else if (!has(days_, tm.tm_mday) || !has(weekdays_, tm.tm_wday)) {
      tm.tm_mday += 1;
      tm.tm_hour = 0;
      tm.tm_min = 0;
    } else if (!has(hours_, tm.tm_hour)) {
      tm.tm_hour += 1;
      tm.tm_min = 0;
    } else if (!has(minutes_, tm.tm_min)) {
      jumped = false;
    } else {
      return candidate;
    }

    if (!jumped) {
      candidate += std::chrono::minutes(1);
      continue;
    }
    tm.tm_sec = 0;
    auto next = common::from_local_tm(tm);
    if (!next.ok()) {
      return std::nullopt;
    }
    // DST transitions can normalize a jump backwards; always make progress.
    candidate = next.value() > candidate
                    ? std::chrono::time_point_cast<std::chrono::minutes>(next.value())
                    : candidate + std::chrono::minutes(1);
  }

  return std::nullopt;
}

std::string CronExpression::to_string() const {
  return fields_[0] + " " + fields_[1] + " " + fields_[2] + " " + fields_[3] + " " + fields_[4];
}

} // namespace tasktide::scheduler
