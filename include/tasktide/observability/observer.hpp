#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tasktide::observability {

struct InfoEvent {
  std::string component;
  std::string message;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

struct ScheduleRegisteredEvent {
  std::string task_id;
  std::string job_id;
  std::string schedule_type;
};

struct ScheduleRemovedEvent {
  std::string task_id;
};

struct RunStartedEvent {
  std::string task_id;
};

struct RunFinishedEvent {
  std::string task_id;
  std::string status;
  std::chrono::milliseconds duration{0};
};

/// A fire instant the job engine dropped because it was later than the misfire grace window.
struct JobMissedEvent {
  std::string job_id;
  std::chrono::seconds lateness{0};
};

struct CleanupEvent {
  std::uint64_t deleted = 0;
  int retention_days = 0;
};

using ObserverEvent =
    std::variant<InfoEvent, WarningEvent, ErrorEvent, ScheduleRegisteredEvent,
                 ScheduleRemovedEvent, RunStartedEvent, RunFinishedEvent, JobMissedEvent,
                 CleanupEvent>;

struct RunDurationMetric {
  std::string task_id;
  std::chrono::milliseconds duration{0};
};

struct RunningTasksMetric {
  std::uint64_t count = 0;
};

struct ScheduledJobsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<RunDurationMetric, RunningTasksMetric, ScheduledJobsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace tasktide::observability
