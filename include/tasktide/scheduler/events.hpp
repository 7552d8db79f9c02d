#pragma once

#include "tasktide/common/time.hpp"

#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace tasktide::scheduler {

struct ScheduleUpdateEvent {
  std::string task_id;
  std::string job_id;
  std::string schedule_type;
  std::string schedule_value;
  std::string human_readable;
  std::optional<common::TimePoint> next_run_time;
};

struct ScheduleRemovedEvent {
  std::string task_id;
};

struct TaskStartedEvent {
  std::string task_id;
  common::TimePoint start_time{};
};

/// The executor returned; `status` and `error` are read back from the task registry.
struct TaskFinishedEvent {
  std::string task_id;
  std::string status;
  common::TimePoint start_time{};
  common::TimePoint end_time{};
  std::optional<std::string> error;
};

/// The executor itself failed (threw or returned an error status).
struct TaskErrorEvent {
  std::string task_id;
  std::string error;
  common::TimePoint end_time{};
};

using SchedulerEvent = std::variant<ScheduleUpdateEvent, ScheduleRemovedEvent, TaskStartedEvent,
                                    TaskFinishedEvent, TaskErrorEvent>;

class ISchedulerListener {
public:
  virtual ~ISchedulerListener() = default;
  virtual void on_event(const SchedulerEvent &event) = 0;
};

class CallbackListener final : public ISchedulerListener {
public:
  explicit CallbackListener(std::function<void(const SchedulerEvent &)> callback)
      : callback_(std::move(callback)) {}

  void on_event(const SchedulerEvent &event) override {
    if (callback_) {
      callback_(event);
    }
  }

private:
  std::function<void(const SchedulerEvent &)> callback_;
};

/// `schedule_update`, `schedule_removed`, `task_started`, `task_finished` or `task_error`.
[[nodiscard]] std::string event_type(const SchedulerEvent &event);
[[nodiscard]] std::string event_task_id(const SchedulerEvent &event);

/// JSON object with `type`, `task_id` and the per-type fields; timestamps are local ISO-8601.
[[nodiscard]] std::string event_to_json(const SchedulerEvent &event);

} // namespace tasktide::scheduler
