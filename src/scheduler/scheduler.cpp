#include "tasktide/scheduler/scheduler.hpp"

#include "tasktide/common/fs.hpp"
#include "tasktide/common/random.hpp"
#include "tasktide/observability/global.hpp"
#include "tasktide/scheduler/trigger.hpp"

#include <algorithm>
#include <exception>

namespace tasktide::scheduler {

namespace {

// The executor writes the outcome into the registry; anything but an explicit failure after a
// clean return counts as completed.
std::string terminal_status(const std::optional<TaskRecord> &record) {
  if (!record.has_value()) {
    return RUN_STATUS_FAILED;
  }
  if (record->status == TASK_STATUS_FAILED) {
    return RUN_STATUS_FAILED;
  }
  if (record->status == TASK_STATUS_COMPLETED) {
    return RUN_STATUS_COMPLETED;
  }
  return record->error.has_value() ? RUN_STATUS_FAILED : RUN_STATUS_COMPLETED;
}

} // namespace

class TaskScheduler::RunningSlot {
public:
  RunningSlot(TaskScheduler &scheduler, std::string task_id)
      : scheduler_(scheduler), task_id_(std::move(task_id)) {}

  ~RunningSlot() {
    std::uint64_t count = 0;
    {
      std::lock_guard<std::mutex> lock(scheduler_.mutex_);
      scheduler_.running_tasks_.erase(task_id_);
      count = scheduler_.running_tasks_.size();
    }
    observability::record_metric(observability::RunningTasksMetric{.count = count});
  }

  RunningSlot(const RunningSlot &) = delete;
  RunningSlot &operator=(const RunningSlot &) = delete;

private:
  TaskScheduler &scheduler_;
  std::string task_id_;
};

JobEngineConfig engine_config_from(const config::SchedulerConfig &config) {
  return JobEngineConfig{
      .misfire_grace_time = std::chrono::seconds(config.misfire_grace_seconds),
      .max_instances = config.max_instances,
      .coalesce = config.coalesce,
      .worker_threads = config.worker_threads,
  };
}

TaskScheduler::TaskScheduler(SchedulerStore &store, ITaskRegistry &registry,
                             ITaskExecutor &executor, config::SchedulerConfig config)
    : store_(store), registry_(registry), executor_(executor), config_(std::move(config)),
      engine_(engine_config_from(config_)) {}

TaskScheduler::~TaskScheduler() { shutdown(); }

void TaskScheduler::start() {
  if (running_.exchange(true)) {
    return;
  }

  load_schedules();
  engine_.start();

  const std::string cleanup_spec = "cron:0 " + std::to_string(config_.cleanup_hour) + " * * *";
  const auto cleanup_trigger = parse_schedule(cleanup_spec);
  if (!cleanup_trigger.ok()) {
    observability::record_error("scheduler",
                                "Invalid cleanup schedule: " + cleanup_trigger.error());
  } else {
    const auto added = engine_.add_job(
        CLEANUP_JOB_ID, cleanup_trigger.value(), [this]() { run_cleanup(); }, true);
    if (!added.ok()) {
      observability::record_error("scheduler", "Failed to add cleanup job: " + added.error());
    }
  }

  observability::record_info("scheduler", "Task scheduler started");
}

void TaskScheduler::shutdown() {
  const bool was_running = running_.exchange(false);
  engine_.shutdown();
  if (was_running) {
    observability::record_info("scheduler", "Task scheduler shut down");
  }
}

void TaskScheduler::load_schedules() {
  const auto stored = store_.get_all_schedules();
  if (!stored.ok()) {
    observability::record_error("scheduler", "Failed to load schedules: " + stored.error());
    return;
  }

  const auto now = common::Clock::now();
  std::size_t loaded = 0;
  for (const auto &schedule : stored.value()) {
    if (!registry_.exists(schedule.task_id)) {
      observability::record_warning("scheduler", "Task " + schedule.task_id +
                                                     " not found, skipping schedule");
      continue;
    }

    std::string spec = schedule.schedule_value;
    if (schedule.schedule_type == "date") {
      if (common::starts_with(spec, "at:")) {
        const auto run_date = common::parse_iso8601(common::trim(spec.substr(3)));
        if (run_date.ok() && run_date.value() <= now) {
          observability::record_warning("scheduler", "Date schedule for task " +
                                                         schedule.task_id +
                                                         " is in the past, skipping");
          continue;
        }
      } else if (common::starts_with(spec, "in ")) {
        // Relative one-shots keep their original deadline across restarts.
        if (!schedule.next_run_time.has_value() || *schedule.next_run_time <= now) {
          observability::record_warning("scheduler", "Relative schedule for task " +
                                                         schedule.task_id +
                                                         " has expired, skipping");
          continue;
        }
        spec = "at:" + common::format_iso8601(*schedule.next_run_time);
      }
    }

    if (schedule_task(schedule.task_id, spec)) {
      ++loaded;
    }
  }

  observability::record_info("scheduler", "Loaded " + std::to_string(loaded) + " schedule(s)");
}

std::string TaskScheduler::make_job_id(const std::string &task_id) {
  std::string id = "task_" + task_id + "_" +
                   std::to_string(common::to_unix_seconds(common::Clock::now()));
  const auto suffix = common::random_hex(4);
  if (suffix.ok()) {
    id += "_" + suffix.value();
  } else {
    observability::record_warning("scheduler", "Job id without random suffix: " + suffix.error());
  }
  return id;
}

bool TaskScheduler::schedule_task(const std::string &task_id, const std::string &schedule_spec,
                                  const std::optional<common::TimePoint> start_time) {
  if (!registry_.exists(task_id)) {
    observability::record_error("scheduler", "Task " + task_id + " not found");
    return false;
  }

  const auto parsed = parse_schedule(schedule_spec, start_time, common::Clock::now());
  if (!parsed.ok()) {
    observability::record_error("scheduler", "Invalid schedule '" + schedule_spec +
                                                 "' for task " + task_id + ": " +
                                                 parsed.error());
    return false;
  }

  const std::string schedule_type = schedule_type_of(parsed.value());
  const std::string job_id = make_job_id(task_id);
  std::unique_lock<std::mutex> registration(registration_mutex_);

  // Register the replacement first so a failure leaves the old binding in place.
  const auto added = engine_.add_job(
      job_id, parsed.value(), [this, task_id]() { on_fire(task_id); }, true);
  if (!added.ok()) {
    observability::record_error("scheduler",
                                "Failed to schedule task " + task_id + ": " + added.error());
    return false;
  }

  std::optional<std::string> replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto previous = scheduled_tasks_.find(task_id);
    if (previous != scheduled_tasks_.end() && previous->second != job_id) {
      replaced = previous->second;
    }
    scheduled_tasks_[task_id] = job_id;
  }
  if (replaced.has_value()) {
    const auto removed = engine_.remove_job(*replaced);
    if (!removed.ok() || !removed.value()) {
      observability::record_warning("scheduler", "Previous job " + *replaced + " was already gone");
    }
  }

  const auto next_run_time = added.value().next_run_time;
  const auto saved =
      store_.save_schedule(task_id, job_id, schedule_type, schedule_spec, next_run_time);
  if (!saved.ok()) {
    observability::record_error("scheduler", "Schedule for task " + task_id +
                                                 " is live but not persisted: " + saved.error());
  }

  const std::string readable = human_readable(schedule_spec);
  const bool updated = registry_.update(task_id, [&](TaskRecord &record) {
    record.schedule = readable;
    record.next_run_time = next_run_time;
  });
  if (!updated) {
    const auto removed = engine_.remove_job(job_id);
    if (!removed.ok()) {
      observability::record_error("scheduler",
                                  "Rollback of job " + job_id + " failed: " + removed.error());
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (const auto it = scheduled_tasks_.find(task_id);
          it != scheduled_tasks_.end() && it->second == job_id) {
        scheduled_tasks_.erase(it);
      }
    }
    const auto deleted = store_.delete_schedule(task_id);
    if (!deleted.ok()) {
      observability::record_error("scheduler", "Rollback of stored schedule for task " + task_id +
                                                   " failed: " + deleted.error());
    }
    observability::record_error("scheduler",
                                "Task " + task_id + " disappeared while being scheduled");
    return false;
  }
  const std::size_t scheduled = scheduled_count();
  registration.unlock();

  observability::record_schedule_registered(task_id, job_id, schedule_type);
  observability::record_metric(observability::ScheduledJobsMetric{.count = scheduled});
  notify_listeners(ScheduleUpdateEvent{
      .task_id = task_id,
      .job_id = job_id,
      .schedule_type = schedule_type,
      .schedule_value = schedule_spec,
      .human_readable = readable,
      .next_run_time = next_run_time,
  });
  return true;
}

bool TaskScheduler::cancel_task(const std::string &task_id) {
  std::unique_lock<std::mutex> registration(registration_mutex_);
  std::string job_id;
  std::size_t scheduled = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = scheduled_tasks_.find(task_id);
    if (it == scheduled_tasks_.end()) {
      observability::record_warning("scheduler", "Task " + task_id + " is not scheduled");
      return false;
    }
    job_id = it->second;
    scheduled_tasks_.erase(it);
    scheduled = scheduled_tasks_.size();
  }

  const auto removed = engine_.remove_job(job_id);
  if (!removed.ok() || !removed.value()) {
    observability::record_warning("scheduler", "Job " + job_id + " not found in the job engine");
  }

  const auto deleted = store_.delete_schedule(task_id);
  if (!deleted.ok()) {
    observability::record_error("scheduler", "Failed to delete stored schedule for task " +
                                                 task_id + ": " + deleted.error());
  }

  // The task itself may already be gone from the registry.
  registry_.update(task_id, [](TaskRecord &record) {
    record.schedule.reset();
    record.next_run_time.reset();
  });
  registration.unlock();

  observability::record_schedule_removed(task_id);
  observability::record_metric(observability::ScheduledJobsMetric{.count = scheduled});
  notify_listeners(ScheduleRemovedEvent{.task_id = task_id});
  return true;
}

std::optional<ScheduleInfo> TaskScheduler::compose_info(const std::string &task_id,
                                                        const std::string &job_id) {
  const auto job = engine_.get_job(job_id);
  if (!job.has_value()) {
    return std::nullopt;
  }

  const auto stored = store_.get_schedule(task_id);
  if (!stored.ok()) {
    observability::record_error("scheduler", "Failed to read schedule for task " + task_id +
                                                 ": " + stored.error());
    return std::nullopt;
  }
  if (!stored.value().has_value()) {
    return std::nullopt;
  }

  const Schedule &schedule = *stored.value();
  return ScheduleInfo{
      .task_id = task_id,
      .job_id = job_id,
      .schedule_type = schedule.schedule_type,
      .schedule_value = schedule.schedule_value,
      .human_readable = human_readable(schedule.schedule_value),
      .next_run_time = job->next_run_time,
      .trigger = trigger_info(job->trigger),
  };
}

std::optional<ScheduleInfo> TaskScheduler::get_task_schedule(const std::string &task_id) {
  std::string job_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = scheduled_tasks_.find(task_id);
    if (it == scheduled_tasks_.end()) {
      return std::nullopt;
    }
    job_id = it->second;
  }
  return compose_info(task_id, job_id);
}

std::map<std::string, ScheduleInfo> TaskScheduler::get_all_schedules() {
  std::vector<std::pair<std::string, std::string>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.assign(scheduled_tasks_.begin(), scheduled_tasks_.end());
  }

  std::map<std::string, ScheduleInfo> out;
  for (const auto &[task_id, job_id] : snapshot) {
    if (auto info = compose_info(task_id, job_id); info.has_value()) {
      out.emplace(task_id, std::move(*info));
    }
  }
  return out;
}

std::vector<ScheduleInfo> TaskScheduler::get_upcoming(const std::size_t limit) {
  std::vector<ScheduleInfo> upcoming;
  for (auto &[_, info] : get_all_schedules()) {
    if (info.next_run_time.has_value()) {
      upcoming.push_back(std::move(info));
    }
  }
  std::sort(upcoming.begin(), upcoming.end(), [](const ScheduleInfo &a, const ScheduleInfo &b) {
    return *a.next_run_time < *b.next_run_time;
  });
  if (upcoming.size() > limit) {
    upcoming.resize(limit);
  }
  return upcoming;
}

common::Result<std::vector<TaskRun>> TaskScheduler::get_task_runs(const std::string &task_id,
                                                                  const std::size_t limit) {
  return store_.get_task_runs(task_id, limit);
}

void TaskScheduler::on_fire(const std::string &task_id) {
  if (!registry_.exists(task_id)) {
    observability::record_error("scheduler", "Scheduled task " + task_id + " no longer exists");
    return;
  }

  std::optional<std::string> job_id;
  std::uint64_t running_count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_tasks_.contains(task_id)) {
      observability::record_warning("scheduler",
                                    "Task " + task_id + " is already running, skipping");
      return;
    }
    running_tasks_.insert(task_id);
    running_count = running_tasks_.size();
    if (const auto it = scheduled_tasks_.find(task_id); it != scheduled_tasks_.end()) {
      job_id = it->second;
    }
  }
  RunningSlot slot(*this, task_id);
  observability::record_metric(observability::RunningTasksMetric{.count = running_count});

  const auto start_time = common::Clock::now();
  const auto run_id = store_.log_task_run(task_id, RUN_STATUS_RUNNING, start_time);
  if (!run_id.ok()) {
    observability::record_error("scheduler", "Failed to record start of task " + task_id +
                                                 ": " + run_id.error());
  }
  observability::record_run_started(task_id);
  notify_listeners(TaskStartedEvent{.task_id = task_id, .start_time = start_time});

  std::optional<common::TimePoint> next_run_time;
  if (job_id.has_value()) {
    if (const auto job = engine_.get_job(*job_id); job.has_value()) {
      next_run_time = job->next_run_time;
    }
  }
  registry_.update(task_id, [&](TaskRecord &record) {
    record.status = TASK_STATUS_PENDING;
    record.progress = 0.0;
    record.result.reset();
    record.error.reset();
    record.next_run_time = next_run_time;
  });

  std::optional<std::string> executor_error;
  try {
    const auto status = executor_.execute(task_id);
    if (!status.ok()) {
      executor_error = status.error();
    }
  } catch (const std::exception &e) {
    executor_error = std::string(e.what());
  } catch (...) {
    executor_error = std::string("unknown executor exception");
  }
  const auto end_time = common::Clock::now();

  std::string final_status;
  std::optional<std::string> error;
  if (executor_error.has_value()) {
    final_status = RUN_STATUS_FAILED;
    error = executor_error;
    registry_.update(task_id, [&](TaskRecord &record) {
      record.status = TASK_STATUS_FAILED;
      record.error = executor_error;
    });
  } else {
    const auto record = registry_.get(task_id);
    final_status = terminal_status(record);
    if (record.has_value()) {
      error = record->error;
    } else {
      error = "task removed during execution";
    }
  }

  if (run_id.ok()) {
    const auto completed = store_.complete_task_run(run_id.value(), final_status, end_time, error);
    if (!completed.ok()) {
      observability::record_error("scheduler", "Failed to record end of task " + task_id + ": " +
                                                   completed.error());
    }
  } else {
    const auto logged = store_.log_task_run(task_id, final_status, start_time, end_time, error);
    if (!logged.ok()) {
      observability::record_error("scheduler", "Failed to record run of task " + task_id + ": " +
                                                   logged.error());
    }
  }

  observability::record_run_finished(
      task_id, final_status,
      std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time));
  if (executor_error.has_value()) {
    notify_listeners(
        TaskErrorEvent{.task_id = task_id, .error = *executor_error, .end_time = end_time});
  } else {
    notify_listeners(TaskFinishedEvent{
        .task_id = task_id,
        .status = final_status,
        .start_time = start_time,
        .end_time = end_time,
        .error = error,
    });
  }
}

common::Result<std::size_t> TaskScheduler::run_cleanup() {
  const auto deleted = store_.cleanup_old_runs(config_.retention_days);
  if (!deleted.ok()) {
    observability::record_error("scheduler", "Run history cleanup failed: " + deleted.error());
  }
  return deleted;
}

void TaskScheduler::add_listener(std::shared_ptr<ISchedulerListener> listener) {
  if (!listener) {
    return;
  }
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

void TaskScheduler::remove_listener(const std::shared_ptr<ISchedulerListener> &listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void TaskScheduler::notify_listeners(const SchedulerEvent &event) {
  std::vector<std::shared_ptr<ISchedulerListener>> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners = listeners_;
  }
  for (const auto &listener : listeners) {
    try {
      listener->on_event(event);
    } catch (const std::exception &e) {
      observability::record_error("scheduler", "Listener failed on " + event_type(event) + ": " +
                                                   e.what());
    } catch (...) {
      observability::record_error("scheduler",
                                  "Listener failed on " + event_type(event) + ": unknown exception");
    }
  }
}

bool TaskScheduler::is_task_running(const std::string &task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_tasks_.contains(task_id);
}

std::size_t TaskScheduler::scheduled_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scheduled_tasks_.size();
}

} // namespace tasktide::scheduler
