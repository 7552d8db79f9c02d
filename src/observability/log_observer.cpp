#include "tasktide/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace tasktide::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, InfoEvent>) {
          log_line("INFO", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ScheduleRegisteredEvent>) {
          log_line("INFO", "schedule.registered task=" + evt.task_id + " job=" + evt.job_id +
                               " type=" + evt.schedule_type);
        } else if constexpr (std::is_same_v<T, ScheduleRemovedEvent>) {
          log_line("INFO", "schedule.removed task=" + evt.task_id);
        } else if constexpr (std::is_same_v<T, RunStartedEvent>) {
          log_line("INFO", "run.start task=" + evt.task_id);
        } else if constexpr (std::is_same_v<T, RunFinishedEvent>) {
          log_line("INFO", "run.end task=" + evt.task_id + " status=" + evt.status +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, JobMissedEvent>) {
          log_line("WARN", "job.missed id=" + evt.job_id +
                               " late_s=" + std::to_string(evt.lateness.count()));
        } else if constexpr (std::is_same_v<T, CleanupEvent>) {
          log_line("INFO", "runs.cleanup deleted=" + std::to_string(evt.deleted) +
                               " retention_days=" + std::to_string(evt.retention_days));
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RunDurationMetric>) {
          log_line("DEBUG", "metric.run_duration_ms task=" + m.task_id + " value=" +
                                std::to_string(m.duration.count()));
        } else if constexpr (std::is_same_v<T, RunningTasksMetric>) {
          log_line("DEBUG", "metric.running_tasks=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ScheduledJobsMetric>) {
          log_line("DEBUG", "metric.scheduled_jobs=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

} // namespace tasktide::observability
