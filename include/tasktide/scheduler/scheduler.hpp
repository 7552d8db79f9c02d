#pragma once

#include "tasktide/common/result.hpp"
#include "tasktide/common/time.hpp"
#include "tasktide/config/schema.hpp"
#include "tasktide/scheduler/events.hpp"
#include "tasktide/scheduler/executor.hpp"
#include "tasktide/scheduler/job_engine.hpp"
#include "tasktide/scheduler/store.hpp"
#include "tasktide/scheduler/task_registry.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tasktide::scheduler {

inline constexpr const char *CLEANUP_JOB_ID = "cleanup_task";

struct ScheduleInfo {
  std::string task_id;
  std::string job_id;
  std::string schedule_type;
  std::string schedule_value;
  std::string human_readable;
  std::optional<common::TimePoint> next_run_time;
  std::map<std::string, std::string> trigger;
};

[[nodiscard]] JobEngineConfig engine_config_from(const config::SchedulerConfig &config);

/// Binds tasks from a registry to time triggers, persists the bindings and run history, and
/// tells listeners about every change.
///
/// Each task has at most one live schedule. A task never overlaps itself: a fire that arrives
/// while the previous run is still going is dropped.
class TaskScheduler {
public:
  TaskScheduler(SchedulerStore &store, ITaskRegistry &registry, ITaskExecutor &executor,
                config::SchedulerConfig config = {});
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler &) = delete;
  TaskScheduler &operator=(const TaskScheduler &) = delete;

  /// Re-registers persisted schedules, starts the engine and the daily run cleanup.
  void start();
  void shutdown();
  [[nodiscard]] bool is_running() const { return running_; }

  /// Replaces any existing schedule of the task. false on an unknown task or bad spec.
  bool schedule_task(const std::string &task_id, const std::string &schedule_spec,
                     std::optional<common::TimePoint> start_time = std::nullopt);
  bool cancel_task(const std::string &task_id);

  [[nodiscard]] std::optional<ScheduleInfo> get_task_schedule(const std::string &task_id);
  [[nodiscard]] std::map<std::string, ScheduleInfo> get_all_schedules();
  /// Live schedules ordered by next run time.
  [[nodiscard]] std::vector<ScheduleInfo> get_upcoming(std::size_t limit = 10);
  [[nodiscard]] common::Result<std::vector<TaskRun>> get_task_runs(const std::string &task_id,
                                                                   std::size_t limit = 10);

  /// One run of the task; normally invoked by the engine.
  void on_fire(const std::string &task_id);
  common::Result<std::size_t> run_cleanup();

  void add_listener(std::shared_ptr<ISchedulerListener> listener);
  void remove_listener(const std::shared_ptr<ISchedulerListener> &listener);

  [[nodiscard]] bool is_task_running(const std::string &task_id) const;
  [[nodiscard]] std::size_t scheduled_count() const;
  [[nodiscard]] JobEngine &engine() { return engine_; }
  [[nodiscard]] const config::SchedulerConfig &config() const { return config_; }

private:
  class RunningSlot;

  void load_schedules();
  void notify_listeners(const SchedulerEvent &event);
  [[nodiscard]] std::optional<ScheduleInfo> compose_info(const std::string &task_id,
                                                         const std::string &job_id);
  [[nodiscard]] static std::string make_job_id(const std::string &task_id);

  SchedulerStore &store_;
  ITaskRegistry &registry_;
  ITaskExecutor &executor_;
  config::SchedulerConfig config_;
  JobEngine engine_;

  // Serializes schedule_task/cancel_task; held across store and registry I/O.
  std::mutex registration_mutex_;
  // Guards the maps below only. Order: registration_mutex_, mutex_, job engine.
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> scheduled_tasks_;
  std::unordered_set<std::string> running_tasks_;

  std::mutex listeners_mutex_;
  std::vector<std::shared_ptr<ISchedulerListener>> listeners_;

  std::atomic<bool> running_{false};
};

} // namespace tasktide::scheduler
