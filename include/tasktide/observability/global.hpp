#pragma once

#include "tasktide/observability/observer.hpp"

#include <memory>

namespace tasktide::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_info(const std::string &component, const std::string &message);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);
void record_schedule_registered(const std::string &task_id, const std::string &job_id,
                                const std::string &schedule_type);
void record_schedule_removed(const std::string &task_id);
void record_run_started(const std::string &task_id);
void record_run_finished(const std::string &task_id, const std::string &status,
                         std::chrono::milliseconds duration);
void record_job_missed(const std::string &job_id, std::chrono::seconds lateness);
void record_cleanup(std::uint64_t deleted, int retention_days);

} // namespace tasktide::observability
