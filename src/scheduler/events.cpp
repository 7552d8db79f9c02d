#include "tasktide/scheduler/events.hpp"

#include "tasktide/common/json_util.hpp"

#include <type_traits>

namespace tasktide::scheduler {

namespace {

std::string time_json(const common::TimePoint time_point) {
  return common::json_quote(common::format_iso8601(time_point));
}

std::string time_json(const std::optional<common::TimePoint> &time_point) {
  return time_point.has_value() ? time_json(*time_point) : std::string("null");
}

} // namespace

std::string event_type(const SchedulerEvent &event) {
  return std::visit(
      [](const auto &evt) -> std::string {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ScheduleUpdateEvent>) {
          return "schedule_update";
        } else if constexpr (std::is_same_v<T, ScheduleRemovedEvent>) {
          return "schedule_removed";
        } else if constexpr (std::is_same_v<T, TaskStartedEvent>) {
          return "task_started";
        } else if constexpr (std::is_same_v<T, TaskFinishedEvent>) {
          return "task_finished";
        } else {
          return "task_error";
        }
      },
      event);
}

std::string event_task_id(const SchedulerEvent &event) {
  return std::visit([](const auto &evt) { return evt.task_id; }, event);
}

std::string event_to_json(const SchedulerEvent &event) {
  std::string json = "{\"type\":" + common::json_quote(event_type(event)) +
                     ",\"task_id\":" + common::json_quote(event_task_id(event));
  std::visit(
      [&json](const auto &evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ScheduleUpdateEvent>) {
          json += ",\"schedule\":{\"job_id\":" + common::json_quote(evt.job_id) +
                  ",\"schedule_type\":" + common::json_quote(evt.schedule_type) +
                  ",\"schedule_value\":" + common::json_quote(evt.schedule_value) +
                  ",\"human_readable\":" + common::json_quote(evt.human_readable) +
                  ",\"next_run_time\":" + time_json(evt.next_run_time) + "}";
        } else if constexpr (std::is_same_v<T, TaskStartedEvent>) {
          json += ",\"start_time\":" + time_json(evt.start_time);
        } else if constexpr (std::is_same_v<T, TaskFinishedEvent>) {
          json += ",\"status\":" + common::json_quote(evt.status) +
                  ",\"start_time\":" + time_json(evt.start_time) +
                  ",\"end_time\":" + time_json(evt.end_time) +
                  ",\"error\":" + common::json_quote_or_null(evt.error);
        } else if constexpr (std::is_same_v<T, TaskErrorEvent>) {
          json += ",\"error\":" + common::json_quote(evt.error) +
                  ",\"end_time\":" + time_json(evt.end_time);
        }
      },
      event);
  json += "}";
  return json;
}

} // namespace tasktide::scheduler
