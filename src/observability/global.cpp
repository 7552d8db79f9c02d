#include "tasktide/observability/global.hpp"

#include <mutex>

namespace tasktide::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_info(const std::string &component, const std::string &message) {
  record_event(InfoEvent{.component = component, .message = message});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_schedule_registered(const std::string &task_id, const std::string &job_id,
                                const std::string &schedule_type) {
  record_event(ScheduleRegisteredEvent{
      .task_id = task_id, .job_id = job_id, .schedule_type = schedule_type});
}

void record_schedule_removed(const std::string &task_id) {
  record_event(ScheduleRemovedEvent{.task_id = task_id});
}

void record_run_started(const std::string &task_id) {
  record_event(RunStartedEvent{.task_id = task_id});
}

void record_run_finished(const std::string &task_id, const std::string &status,
                         const std::chrono::milliseconds duration) {
  record_event(RunFinishedEvent{.task_id = task_id, .status = status, .duration = duration});
  record_metric(RunDurationMetric{.task_id = task_id, .duration = duration});
}

void record_job_missed(const std::string &job_id, const std::chrono::seconds lateness) {
  record_event(JobMissedEvent{.job_id = job_id, .lateness = lateness});
}

void record_cleanup(const std::uint64_t deleted, const int retention_days) {
  record_event(CleanupEvent{.deleted = deleted, .retention_days = retention_days});
}

} // namespace tasktide::observability
