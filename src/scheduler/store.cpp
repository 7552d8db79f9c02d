#include "tasktide/scheduler/store.hpp"

#include "tasktide/observability/global.hpp"
#include "tasktide/scheduler/legacy.hpp"

namespace tasktide::scheduler {

namespace {

constexpr const char *kNotInitialized = "scheduler db not initialized";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

void bind_optional_time(sqlite3_stmt *stmt, int index,
                        const std::optional<common::TimePoint> &value) {
  if (value.has_value()) {
    sqlite3_bind_int64(stmt, index, common::to_unix_seconds(*value));
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

void bind_optional_text(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value) {
  if (value.has_value()) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::string column_text(sqlite3_stmt *stmt, int index) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
  return text == nullptr ? std::string() : std::string(text);
}

std::optional<common::TimePoint> column_optional_time(sqlite3_stmt *stmt, int index) {
  if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
    return std::nullopt;
  }
  return common::from_unix_seconds(sqlite3_column_int64(stmt, index));
}

Schedule row_to_schedule(sqlite3_stmt *stmt) {
  Schedule schedule;
  schedule.task_id = column_text(stmt, 0);
  schedule.job_id = column_text(stmt, 1);
  schedule.schedule_type = column_text(stmt, 2);
  schedule.schedule_value = column_text(stmt, 3);
  schedule.created_at = common::from_unix_seconds(sqlite3_column_int64(stmt, 4));
  schedule.next_run_time = column_optional_time(stmt, 5);
  return schedule;
}

TaskRun row_to_run(sqlite3_stmt *stmt) {
  TaskRun run;
  run.id = sqlite3_column_int64(stmt, 0);
  run.task_id = column_text(stmt, 1);
  run.status = column_text(stmt, 2);
  run.start_time = common::from_unix_seconds(sqlite3_column_int64(stmt, 3));
  run.end_time = column_optional_time(stmt, 4);
  if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
    run.error = column_text(stmt, 5);
  }
  return run;
}

common::Status storage_error(sqlite3 *db, const std::string &operation) {
  const std::string message = operation + ": " + sqlite3_errmsg(db);
  observability::record_error("store", message);
  return common::Status::error(message);
}

} // namespace

SchedulerStore::SchedulerStore(std::filesystem::path persistence_dir)
    : dir_(std::move(persistence_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    init_status_ = common::Status::error("Failed to create persistence directory " +
                                         dir_.string() + ": " + ec.message());
    observability::record_error("store", init_status_.error());
    return;
  }

  if (sqlite3_open(db_path().string().c_str(), &db_) != SQLITE_OK) {
    init_status_ = common::Status::error("Failed to open " + db_path().string() + ": " +
                                         (db_ == nullptr ? "out of memory" : sqlite3_errmsg(db_)));
    observability::record_error("store", init_status_.error());
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }

  init_status_ = init_schema();
  if (!init_status_.ok()) {
    observability::record_error("store", "Error initializing database: " + init_status_.error());
    return;
  }

  LegacyMigrator migrator(legacy_path());
  const auto migrated = migrator.migrate(*this);
  if (!migrated.ok()) {
    observability::record_error("store", "Error migrating legacy schedules: " + migrated.error());
  }
  observability::record_info("store", "Scheduler persistence initialized at " + dir_.string());
}

SchedulerStore::~SchedulerStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SchedulerStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }

  sqlite3_busy_timeout(db_, 5000);
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS schedules (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  task_id TEXT NOT NULL UNIQUE,
  job_id TEXT NOT NULL,
  schedule_type TEXT NOT NULL,
  schedule_value TEXT NOT NULL,
  created_at INTEGER NOT NULL,
  next_run_time INTEGER
);
CREATE TABLE IF NOT EXISTS task_runs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  task_id TEXT NOT NULL,
  status TEXT NOT NULL,
  start_time INTEGER NOT NULL,
  end_time INTEGER,
  error TEXT
);
CREATE INDEX IF NOT EXISTS idx_task_runs_task_start ON task_runs(task_id, start_time);
)");
}

common::Status SchedulerStore::save_schedule(const std::string &task_id, const std::string &job_id,
                                             const std::string &schedule_type,
                                             const std::string &schedule_value,
                                             std::optional<common::TimePoint> next_run_time) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT INTO schedules(task_id, job_id, schedule_type, schedule_value, created_at, "
      "next_run_time) VALUES(?1, ?2, ?3, ?4, ?5, ?6) "
      "ON CONFLICT(task_id) DO UPDATE SET job_id = excluded.job_id, "
      "schedule_type = excluded.schedule_type, schedule_value = excluded.schedule_value, "
      "next_run_time = excluded.next_run_time";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_error(db_, "save_schedule");
  }

  sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, job_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, schedule_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, schedule_value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 5, common::to_unix_seconds(common::Clock::now()));
  bind_optional_time(stmt, 6, next_run_time);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_error(db_, "save_schedule");
  }
  return common::Status::success();
}

common::Status SchedulerStore::delete_schedule(const std::string &task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM schedules WHERE task_id = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return storage_error(db_, "delete_schedule");
  }
  sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_error(db_, "delete_schedule");
  }
  return common::Status::success();
}

common::Result<std::optional<Schedule>> SchedulerStore::get_schedule(const std::string &task_id) {
  using ResultT = common::Result<std::optional<Schedule>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ResultT::failure(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT task_id, job_id, schedule_type, schedule_value, created_at, "
                    "next_run_time FROM schedules WHERE task_id = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return ResultT::failure(storage_error(db_, "get_schedule").error());
  }
  sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<Schedule> found;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    found = row_to_schedule(stmt);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return ResultT::failure(storage_error(db_, "get_schedule").error());
  }
  return ResultT::success(std::move(found));
}

common::Result<std::vector<Schedule>> SchedulerStore::get_all_schedules() {
  using ResultT = common::Result<std::vector<Schedule>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ResultT::failure(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT task_id, job_id, schedule_type, schedule_value, created_at, "
                    "next_run_time FROM schedules ORDER BY task_id ASC";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return ResultT::failure(storage_error(db_, "get_all_schedules").error());
  }

  std::vector<Schedule> out;
  int rc = SQLITE_DONE;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(row_to_schedule(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ResultT::failure(storage_error(db_, "get_all_schedules").error());
  }
  return ResultT::success(std::move(out));
}

common::Result<bool> SchedulerStore::has_schedule(const std::string &task_id) {
  auto schedule = get_schedule(task_id);
  if (!schedule.ok()) {
    return common::Result<bool>::failure(schedule.error());
  }
  return common::Result<bool>::success(schedule.value().has_value());
}

common::Result<std::size_t> SchedulerStore::import_schedules(const std::vector<Schedule> &rows) {
  using ResultT = common::Result<std::size_t>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ResultT::failure(kNotInitialized);
  }

  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return ResultT::failure(status.error());
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT INTO schedules(task_id, job_id, schedule_type, schedule_value, created_at, "
      "next_run_time) VALUES(?1, ?2, ?3, ?4, ?5, ?6) ON CONFLICT(task_id) DO NOTHING";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    const std::string message = sqlite3_errmsg(db_);
    (void)exec_sql(db_, "ROLLBACK;");
    return ResultT::failure(message);
  }

  std::size_t inserted = 0;
  for (const auto &row : rows) {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_text(stmt, 1, row.task_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, row.job_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, row.schedule_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, row.schedule_value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, common::to_unix_seconds(row.created_at));
    bind_optional_time(stmt, 6, row.next_run_time);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      const std::string message = sqlite3_errmsg(db_);
      sqlite3_finalize(stmt);
      (void)exec_sql(db_, "ROLLBACK;");
      return ResultT::failure(message);
    }
    inserted += static_cast<std::size_t>(sqlite3_changes(db_));
  }
  sqlite3_finalize(stmt);

  status = exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    (void)exec_sql(db_, "ROLLBACK;");
    return ResultT::failure(status.error());
  }
  return ResultT::success(inserted);
}

common::Result<std::int64_t> SchedulerStore::log_task_run(const std::string &task_id,
                                                          const std::string &status,
                                                          const common::TimePoint start_time,
                                                          std::optional<common::TimePoint> end_time,
                                                          const std::optional<std::string> &error) {
  using ResultT = common::Result<std::int64_t>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ResultT::failure(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO task_runs(task_id, status, start_time, end_time, error) "
                    "VALUES(?1, ?2, ?3, ?4, ?5)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return ResultT::failure(storage_error(db_, "log_task_run").error());
  }
  sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, status.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, common::to_unix_seconds(start_time));
  bind_optional_time(stmt, 4, end_time);
  bind_optional_text(stmt, 5, error);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ResultT::failure(storage_error(db_, "log_task_run").error());
  }
  return ResultT::success(sqlite3_last_insert_rowid(db_));
}

common::Status SchedulerStore::complete_task_run(const std::int64_t run_id,
                                                 const std::string &status,
                                                 const common::TimePoint end_time,
                                                 const std::optional<std::string> &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "UPDATE task_runs SET status = ?2, end_time = ?3, error = ?4 "
                    "WHERE id = ?1 AND status = 'running'";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_error(db_, "complete_task_run");
  }
  sqlite3_bind_int64(stmt, 1, run_id);
  sqlite3_bind_text(stmt, 2, status.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, common::to_unix_seconds(end_time));
  bind_optional_text(stmt, 4, error);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_error(db_, "complete_task_run");
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error("no running task run with id " + std::to_string(run_id));
  }
  return common::Status::success();
}

common::Result<std::vector<TaskRun>> SchedulerStore::query_runs(const char *sql,
                                                                const std::string *task_id,
                                                                const std::size_t limit) {
  using ResultT = common::Result<std::vector<TaskRun>>;
  if (db_ == nullptr) {
    return ResultT::failure(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return ResultT::failure(storage_error(db_, "query task_runs").error());
  }
  int index = 1;
  if (task_id != nullptr) {
    sqlite3_bind_text(stmt, index++, task_id->c_str(), -1, SQLITE_TRANSIENT);
  }
  sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(limit));

  std::vector<TaskRun> out;
  int rc = SQLITE_DONE;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(row_to_run(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ResultT::failure(storage_error(db_, "query task_runs").error());
  }
  return ResultT::success(std::move(out));
}

common::Result<std::vector<TaskRun>> SchedulerStore::get_task_runs(const std::string &task_id,
                                                                   const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  return query_runs("SELECT id, task_id, status, start_time, end_time, error FROM task_runs "
                    "WHERE task_id = ?1 ORDER BY start_time DESC, id DESC LIMIT ?2",
                    &task_id, limit);
}

common::Result<std::vector<TaskRun>> SchedulerStore::get_recent_runs(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  return query_runs("SELECT id, task_id, status, start_time, end_time, error FROM task_runs "
                    "ORDER BY start_time DESC, id DESC LIMIT ?1",
                    nullptr, limit);
}

common::Result<std::size_t> SchedulerStore::cleanup_old_runs(const std::uint32_t retention_days,
                                                             const common::TimePoint now) {
  using ResultT = common::Result<std::size_t>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ResultT::failure(kNotInitialized);
  }

  const auto cutoff = now - std::chrono::hours(24) * static_cast<std::int64_t>(retention_days);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM task_runs WHERE start_time < ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return ResultT::failure(storage_error(db_, "cleanup_old_runs").error());
  }
  sqlite3_bind_int64(stmt, 1, common::to_unix_seconds(cutoff));
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ResultT::failure(storage_error(db_, "cleanup_old_runs").error());
  }

  const auto deleted = static_cast<std::size_t>(sqlite3_changes(db_));
  observability::record_cleanup(deleted, static_cast<int>(retention_days));
  return ResultT::success(deleted);
}

} // namespace tasktide::scheduler
