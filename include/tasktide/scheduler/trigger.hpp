#pragma once

#include "tasktide/common/result.hpp"
#include "tasktide/common/time.hpp"
#include "tasktide/scheduler/cron.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace tasktide::scheduler {

enum class IntervalUnit { Seconds, Minutes, Hours, Days };

struct CronTrigger {
  CronExpression expression;
};

/// Fires at anchor + k * interval for k >= 1.
struct IntervalTrigger {
  IntervalUnit unit = IntervalUnit::Seconds;
  std::uint64_t count = 0;
  std::chrono::seconds interval{0};
  common::TimePoint anchor{};
};

struct DateTrigger {
  common::TimePoint run_date{};
};

using TriggerDescriptor = std::variant<CronTrigger, IntervalTrigger, DateTrigger>;

/// Parses one of `cron:<5 fields>`, `every N<unit>`, `at:<ISO-8601>` or `in N<unit>`
/// (unit one of s, m, h, d). `now` anchors relative specs and intervals without a start time.
[[nodiscard]] common::Result<TriggerDescriptor>
parse_schedule(const std::string &spec, std::optional<common::TimePoint> start_time = std::nullopt,
               common::TimePoint now = common::Clock::now());

/// Best-effort description of a spec; never fails, unrecognized input is echoed back.
[[nodiscard]] std::string human_readable(const std::string &spec);

/// `type` plus cron field strings, interval `seconds` or date `run_date`.
[[nodiscard]] std::map<std::string, std::string> trigger_info(const TriggerDescriptor &trigger);

/// `cron`, `interval` or `date`.
[[nodiscard]] std::string schedule_type_of(const TriggerDescriptor &trigger);

/// Next fire instant after `previous` (or the first one relative to `now` when nothing has
/// fired yet); nullopt once the trigger is exhausted.
[[nodiscard]] std::optional<common::TimePoint>
next_fire_time(const TriggerDescriptor &trigger, std::optional<common::TimePoint> previous,
               common::TimePoint now);

[[nodiscard]] std::string unit_word(IntervalUnit unit, std::uint64_t count);

} // namespace tasktide::scheduler
