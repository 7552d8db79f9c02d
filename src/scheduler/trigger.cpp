#include "tasktide/scheduler/trigger.hpp"

#include "tasktide/common/fs.hpp"
#include "tasktide/observability/global.hpp"

#include <charconv>
#include <type_traits>

namespace tasktide::scheduler {

namespace {

constexpr const char *kCronPrefix = "cron:";
constexpr const char *kEveryPrefix = "every ";
constexpr const char *kAtPrefix = "at:";
constexpr const char *kInPrefix = "in ";

// 100 years; keeps count * unit and anchor arithmetic far from overflow.
constexpr std::int64_t kMaxIntervalSeconds = 100LL * 366 * 24 * 3600;

struct CountUnit {
  std::uint64_t count = 0;
  IntervalUnit unit = IntervalUnit::Seconds;
};

std::optional<CountUnit> split_count_unit(const std::string &text) {
  if (text.size() < 2) {
    return std::nullopt;
  }
  CountUnit out;
  switch (text.back()) {
  case 's':
    out.unit = IntervalUnit::Seconds;
    break;
  case 'm':
    out.unit = IntervalUnit::Minutes;
    break;
  case 'h':
    out.unit = IntervalUnit::Hours;
    break;
  case 'd':
    out.unit = IntervalUnit::Days;
    break;
  default:
    return std::nullopt;
  }
  const char *first = text.data();
  const char *last = text.data() + text.size() - 1;
  if (*first < '0' || *first > '9') {
    return std::nullopt;
  }
  auto [ptr, ec] = std::from_chars(first, last, out.count);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return out;
}

std::int64_t unit_seconds(const IntervalUnit unit) {
  switch (unit) {
  case IntervalUnit::Seconds:
    return 1;
  case IntervalUnit::Minutes:
    return 60;
  case IntervalUnit::Hours:
    return 3600;
  case IntervalUnit::Days:
    return 86400;
  }
  return 1;
}

common::Result<std::chrono::seconds> span_of(const std::string &body, const char *what,
                                             CountUnit &parsed) {
  const auto count_unit = split_count_unit(body);
  if (!count_unit.has_value()) {
    return common::Result<std::chrono::seconds>::failure(std::string("invalid ") + what +
                                                         " specification: '" + body + "'");
  }
  if (count_unit->count == 0) {
    return common::Result<std::chrono::seconds>::failure(std::string(what) +
                                                         " value must be positive");
  }
  const std::int64_t per_unit = unit_seconds(count_unit->unit);
  if (count_unit->count > static_cast<std::uint64_t>(kMaxIntervalSeconds / per_unit)) {
    return common::Result<std::chrono::seconds>::failure(std::string(what) + " is too large: '" +
                                                         body + "'");
  }
  parsed = *count_unit;
  return common::Result<std::chrono::seconds>::success(
      std::chrono::seconds(static_cast<std::int64_t>(count_unit->count) * per_unit));
}

common::Result<TriggerDescriptor> parse_cron(const std::string &body) {
  auto expression = CronExpression::parse(body);
  if (!expression.ok()) {
    return common::Result<TriggerDescriptor>::failure("invalid cron expression '" + body +
                                                      "': " + expression.error());
  }
  return common::Result<TriggerDescriptor>::success(
      CronTrigger{.expression = std::move(expression.value())});
}

common::Result<TriggerDescriptor> parse_interval(const std::string &body,
                                                 std::optional<common::TimePoint> start_time,
                                                 const common::TimePoint now) {
  CountUnit parsed;
  const auto span = span_of(body, "interval", parsed);
  if (!span.ok()) {
    return common::Result<TriggerDescriptor>::failure(span.error());
  }
  return common::Result<TriggerDescriptor>::success(
      IntervalTrigger{.unit = parsed.unit,
                      .count = parsed.count,
                      .interval = span.value(),
                      .anchor = start_time.value_or(now)});
}

common::Result<TriggerDescriptor> parse_date(const std::string &body, const common::TimePoint now) {
  auto run_date = common::parse_iso8601(body);
  if (!run_date.ok()) {
    return common::Result<TriggerDescriptor>::failure(run_date.error());
  }
  if (run_date.value() <= now) {
    observability::record_warning("trigger", "Date is in the past: " + body);
  }
  return common::Result<TriggerDescriptor>::success(DateTrigger{.run_date = run_date.value()});
}

common::Result<TriggerDescriptor> parse_relative(const std::string &body,
                                                 const common::TimePoint now) {
  CountUnit parsed;
  const auto span = span_of(body, "relative", parsed);
  if (!span.ok()) {
    return common::Result<TriggerDescriptor>::failure(span.error());
  }
  return common::Result<TriggerDescriptor>::success(
      DateTrigger{.run_date = std::chrono::time_point_cast<common::Clock::duration>(
                      now + span.value())});
}

} // namespace

std::string unit_word(const IntervalUnit unit, const std::uint64_t count) {
  const bool one = count == 1;
  switch (unit) {
  case IntervalUnit::Seconds:
    return one ? "second" : "seconds";
  case IntervalUnit::Minutes:
    return one ? "minute" : "minutes";
  case IntervalUnit::Hours:
    return one ? "hour" : "hours";
  case IntervalUnit::Days:
    return one ? "day" : "days";
  }
  return "";
}

common::Result<TriggerDescriptor> parse_schedule(const std::string &spec,
                                                 std::optional<common::TimePoint> start_time,
                                                 const common::TimePoint now) {
  if (common::starts_with(spec, kCronPrefix)) {
    return parse_cron(common::trim(spec.substr(5)));
  }
  if (common::starts_with(spec, kEveryPrefix)) {
    return parse_interval(common::trim(spec.substr(6)), start_time, now);
  }
  if (common::starts_with(spec, kAtPrefix)) {
    return parse_date(common::trim(spec.substr(3)), now);
  }
  if (common::starts_with(spec, kInPrefix)) {
    return parse_relative(common::trim(spec.substr(3)), now);
  }
  return common::Result<TriggerDescriptor>::failure("unrecognized schedule format");
}

std::string human_readable(const std::string &spec) {
  if (common::starts_with(spec, kCronPrefix)) {
    return "Cron schedule: " + common::trim(spec.substr(5));
  }
  if (common::starts_with(spec, kEveryPrefix) || common::starts_with(spec, kInPrefix)) {
    const bool every = common::starts_with(spec, kEveryPrefix);
    const auto count_unit = split_count_unit(common::trim(spec.substr(every ? 6 : 3)));
    if (!count_unit.has_value()) {
      return spec;
    }
    return std::string(every ? "Every " : "In ") + std::to_string(count_unit->count) + " " +
           unit_word(count_unit->unit, count_unit->count);
  }
  if (common::starts_with(spec, kAtPrefix)) {
    const std::string body = common::trim(spec.substr(3));
    const auto run_date = common::parse_iso8601(body);
    if (!run_date.ok()) {
      return "At " + body;
    }
    return "At " + common::format_local(run_date.value(), "%Y-%m-%d %H:%M:%S");
  }
  return spec;
}

std::map<std::string, std::string> trigger_info(const TriggerDescriptor &trigger) {
  std::map<std::string, std::string> info;
  std::visit(
      [&info](const auto &t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, CronTrigger>) {
          info["type"] = "cron";
          info["minute"] = t.expression.minute();
          info["hour"] = t.expression.hour();
          info["day"] = t.expression.day();
          info["month"] = t.expression.month();
          info["day_of_week"] = t.expression.day_of_week();
        } else if constexpr (std::is_same_v<T, IntervalTrigger>) {
          info["type"] = "interval";
          info["seconds"] = std::to_string(t.interval.count());
        } else if constexpr (std::is_same_v<T, DateTrigger>) {
          info["type"] = "date";
          info["run_date"] = common::format_iso8601(t.run_date);
        }
      },
      trigger);
  return info;
}

std::string schedule_type_of(const TriggerDescriptor &trigger) {
  return std::visit(
      [](const auto &t) -> std::string {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, CronTrigger>) {
          return "cron";
        } else if constexpr (std::is_same_v<T, IntervalTrigger>) {
          return "interval";
        } else {
          return "date";
        }
      },
      trigger);
}

std::optional<common::TimePoint> next_fire_time(const TriggerDescriptor &trigger,
                                                std::optional<common::TimePoint> previous,
                                                const common::TimePoint now) {
  return std::visit(
      [&](const auto &t) -> std::optional<common::TimePoint> {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, CronTrigger>) {
          return t.expression.next_occurrence(previous.value_or(now));
        } else if constexpr (std::is_same_v<T, IntervalTrigger>) {
          if (previous.has_value()) {
            return *previous + t.interval;
          }
          if (now <= t.anchor + t.interval) {
            return t.anchor + t.interval;
          }
          const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - t.anchor);
          const auto periods = elapsed.count() / t.interval.count() + 1;
          return t.anchor + t.interval * periods;
        } else {
          if (previous.has_value()) {
            return std::nullopt;
          }
          return t.run_date;
        }
      },
      trigger);
}

} // namespace tasktide::scheduler
