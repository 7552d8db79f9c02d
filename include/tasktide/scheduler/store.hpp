#pragma once

#include "tasktide/common/result.hpp"
#include "tasktide/common/time.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace tasktide::scheduler {

inline constexpr const char *RUN_STATUS_RUNNING = "running";
inline constexpr const char *RUN_STATUS_COMPLETED = "completed";
inline constexpr const char *RUN_STATUS_FAILED = "failed";

struct Schedule {
  std::string task_id;
  std::string job_id;
  std::string schedule_type;
  std::string schedule_value;
  common::TimePoint created_at{};
  std::optional<common::TimePoint> next_run_time;
};

struct TaskRun {
  std::int64_t id = 0;
  std::string task_id;
  std::string status;
  common::TimePoint start_time{};
  std::optional<common::TimePoint> end_time;
  std::optional<std::string> error;
};

/// SQLite-backed `schedules` and `task_runs` tables under one persistence directory.
///
/// Construction creates the directory, opens `scheduler.db`, ensures the schema and imports a
/// legacy `scheduled_tasks.json` when one is present. Every operation is serialized by an
/// internal mutex.
class SchedulerStore {
public:
  explicit SchedulerStore(std::filesystem::path persistence_dir);
  ~SchedulerStore();

  SchedulerStore(const SchedulerStore &) = delete;
  SchedulerStore &operator=(const SchedulerStore &) = delete;

  [[nodiscard]] const common::Status &init_status() const { return init_status_; }
  [[nodiscard]] const std::filesystem::path &persistence_dir() const { return dir_; }
  [[nodiscard]] std::filesystem::path db_path() const { return dir_ / "scheduler.db"; }
  [[nodiscard]] std::filesystem::path legacy_path() const { return dir_ / "scheduled_tasks.json"; }

  /// Upsert by task_id; `created_at` of an existing row is kept.
  [[nodiscard]] common::Status save_schedule(const std::string &task_id, const std::string &job_id,
                                             const std::string &schedule_type,
                                             const std::string &schedule_value,
                                             std::optional<common::TimePoint> next_run_time);
  [[nodiscard]] common::Status delete_schedule(const std::string &task_id);
  [[nodiscard]] common::Result<std::optional<Schedule>> get_schedule(const std::string &task_id);
  [[nodiscard]] common::Result<std::vector<Schedule>> get_all_schedules();
  [[nodiscard]] common::Result<bool> has_schedule(const std::string &task_id);

  /// Inserts the rows whose task_id is not present yet, all in one transaction.
  /// Returns the number of rows inserted.
  [[nodiscard]] common::Result<std::size_t> import_schedules(const std::vector<Schedule> &rows);

  /// Appends one run row and returns its id.
  [[nodiscard]] common::Result<std::int64_t>
  log_task_run(const std::string &task_id, const std::string &status,
               common::TimePoint start_time,
               std::optional<common::TimePoint> end_time = std::nullopt,
               const std::optional<std::string> &error = std::nullopt);
  /// Moves a `running` row to its terminal status.
  [[nodiscard]] common::Status complete_task_run(std::int64_t run_id, const std::string &status,
                                                 common::TimePoint end_time,
                                                 const std::optional<std::string> &error);
  [[nodiscard]] common::Result<std::vector<TaskRun>> get_task_runs(const std::string &task_id,
                                                                   std::size_t limit = 10);
  [[nodiscard]] common::Result<std::vector<TaskRun>> get_recent_runs(std::size_t limit = 20);
  [[nodiscard]] common::Result<std::size_t>
  cleanup_old_runs(std::uint32_t retention_days, common::TimePoint now = common::Clock::now());

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::vector<TaskRun>> query_runs(const char *sql,
                                                                const std::string *task_id,
                                                                std::size_t limit);

  std::filesystem::path dir_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  common::Status init_status_ = common::Status::success();
};

} // namespace tasktide::scheduler
