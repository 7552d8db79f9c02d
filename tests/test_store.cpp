#include "test_framework.hpp"

#include "tasktide/scheduler/store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>

void register_store_tests(std::vector<tasktide::tests::TestCase> &tests) {
  using tasktide::tests::require;
  using tasktide::tests::require_eq;
  namespace sc = tasktide::scheduler;
  namespace common = tasktide::common;

  tests.push_back({"store_creates_directory_and_database", [] {
                     tasktide::testing::TempWorkspace workspace;
                     const auto dir = workspace.path() / "nested" / "scheduler";
                     sc::SchedulerStore store(dir);
                     require(store.init_status().ok(), store.init_status().error());
                     require(std::filesystem::exists(store.db_path()), "db file created");
                     auto all = store.get_all_schedules();
                     require(all.ok() && all.value().empty(), "fresh store is empty");
                   }});

  tests.push_back({"store_upsert_keeps_created_at", [] {
                     tasktide::testing::TempWorkspace workspace;
                     sc::SchedulerStore store(workspace.path());
                     const auto next = common::from_unix_seconds(1900000000);
                     require(store.save_schedule("t1", "job-a", "interval", "every 1h", next).ok(),
                             "first save");
                     auto first = store.get_schedule("t1");
                     require(first.ok() && first.value().has_value(), "row present");
                     const auto created = first.value()->created_at;

                     require(store.save_schedule("t1", "job-b", "cron", "cron:0 9 * * *",
                                                 std::nullopt)
                                 .ok(),
                             "second save");
                     auto second = store.get_schedule("t1");
                     require(second.ok() && second.value().has_value(), "row still present");
                     require_eq(second.value()->job_id, "job-b", "job id replaced");
                     require_eq(second.value()->schedule_type, "cron", "type replaced");
                     require_eq(second.value()->schedule_value, "cron:0 9 * * *", "value replaced");
                     require(!second.value()->next_run_time.has_value(), "next run cleared");
                     require(second.value()->created_at == created, "created_at preserved");

                     auto all = store.get_all_schedules();
                     require(all.ok() && all.value().size() == 1, "one row per task");
                   }});

  tests.push_back({"store_delete_schedule", [] {
                     tasktide::testing::TempWorkspace workspace;
                     sc::SchedulerStore store(workspace.path());
                     require(store.save_schedule("t1", "j", "interval", "every 1m", std::nullopt)
                                 .ok(),
                             "save");
                     require(store.has_schedule("t1").value_or(false), "present");
                     require(store.delete_schedule("t1").ok(), "delete");
                     require(!store.has_schedule("t1").value_or(true), "absent");
                     auto missing = store.get_schedule("t1");
                     require(missing.ok() && !missing.value().has_value(), "get returns empty");
                     require(store.delete_schedule("t1").ok(), "deleting twice is harmless");
                   }});

  tests.push_back({"store_run_lifecycle", [] {
                     tasktide::testing::TempWorkspace workspace;
                     sc::SchedulerStore store(workspace.path());
                     const auto start = common::Clock::now();
                     auto id = store.log_task_run("t1", sc::RUN_STATUS_RUNNING, start);
                     require(id.ok(), id.error());

                     auto runs = store.get_task_runs("t1");
                     require(runs.ok() && runs.value().size() == 1, "one run");
                     require_eq(runs.value()[0].status, "running", "running first");
                     require(!runs.value()[0].end_time.has_value(), "no end yet");

                     require(store
                                 .complete_task_run(id.value(), sc::RUN_STATUS_FAILED,
                                                    start + std::chrono::seconds(2),
                                                    std::string("boom"))
                                 .ok(),
                             "complete");
                     runs = store.get_task_runs("t1");
                     require(runs.ok() && runs.value().size() == 1, "still one run");
                     require_eq(runs.value()[0].status, "failed", "terminal status");
                     require(runs.value()[0].error == std::optional<std::string>("boom"),
                             "error kept");
                     require(runs.value()[0].end_time.has_value(), "end time set");

                     require(!store
                                  .complete_task_run(id.value(), sc::RUN_STATUS_COMPLETED,
                                                     start, std::nullopt)
                                  .ok(),
                             "terminal rows are final");
                   }});

  tests.push_back({"store_runs_newest_first_with_limit", [] {
                     tasktide::testing::TempWorkspace workspace;
                     sc::SchedulerStore store(workspace.path());
                     const auto base = common::Clock::now() - std::chrono::hours(1);
                     for (int i = 0; i < 5; ++i) {
                       require(store
                                   .log_task_run("t1", sc::RUN_STATUS_COMPLETED,
                                                 base + std::chrono::minutes(i),
                                                 base + std::chrono::minutes(i))
                                   .ok(),
                               "log run");
                     }
                     require(store.log_task_run("t2", sc::RUN_STATUS_COMPLETED, base).ok(),
                             "other task");

                     auto runs = store.get_task_runs("t1", 3);
                     require(runs.ok() && runs.value().size() == 3, "limit applied");
                     require(runs.value()[0].start_time > runs.value()[1].start_time,
                             "descending");
                     require(runs.value()[0].start_time ==
                                 common::from_unix_seconds(common::to_unix_seconds(
                                     base + std::chrono::minutes(4))),
                             "newest first");

                     auto recent = store.get_recent_runs(20);
                     require(recent.ok() && recent.value().size() == 6, "all tasks");
                   }});

  tests.push_back({"store_cleanup_respects_retention", [] {
                     tasktide::testing::TempWorkspace workspace;
                     sc::SchedulerStore store(workspace.path());
                     const auto now = common::Clock::now();
                     const auto day = std::chrono::hours(24);
                     require(store.log_task_run("old", sc::RUN_STATUS_COMPLETED, now - 40 * day)
                                 .ok(),
                             "old run");
                     require(store.log_task_run("old", sc::RUN_STATUS_FAILED, now - 31 * day)
                                 .ok(),
                             "barely old run");
                     require(store.log_task_run("new", sc::RUN_STATUS_COMPLETED, now - 29 * day)
                                 .ok(),
                             "recent run");
                     require(store.log_task_run("new", sc::RUN_STATUS_RUNNING, now).ok(),
                             "current run");

                     auto deleted = store.cleanup_old_runs(30, now);
                     require(deleted.ok(), deleted.error());
                     require(deleted.value() == 2, "two rows deleted");

                     auto old_runs = store.get_task_runs("old");
                     require(old_runs.ok() && old_runs.value().empty(), "old rows gone");
                     auto new_runs = store.get_task_runs("new");
                     require(new_runs.ok() && new_runs.value().size() == 2, "new rows kept");
                   }});

  tests.push_back({"store_import_skips_existing_rows", [] {
                     tasktide::testing::TempWorkspace workspace;
                     sc::SchedulerStore store(workspace.path());
                     require(store.save_schedule("a", "job-a", "cron", "cron:0 0 * * *",
                                                 std::nullopt)
                                 .ok(),
                             "seed");
                     std::vector<sc::Schedule> rows;
                     rows.push_back(sc::Schedule{.task_id = "a",
                                                 .job_id = "legacy-a",
                                                 .schedule_type = "interval",
                                                 .schedule_value = "every 1h",
                                                 .created_at = common::Clock::now()});
                     rows.push_back(sc::Schedule{.task_id = "b",
                                                 .job_id = "legacy-b",
                                                 .schedule_type = "interval",
                                                 .schedule_value = "every 2h",
                                                 .created_at = common::Clock::now()});
                     auto imported = store.import_schedules(rows);
                     require(imported.ok(), imported.error());
                     require(imported.value() == 1, "only the new row");

                     auto a = store.get_schedule("a");
                     require(a.ok() && a.value().has_value(), "a present");
                     require_eq(a.value()->job_id, "job-a", "existing row untouched");
                     auto all = store.get_all_schedules();
                     require(all.ok() && all.value().size() == 2, "two rows");
                   }});

  tests.push_back({"store_reopens_persisted_state", [] {
                     tasktide::testing::TempWorkspace workspace;
                     {
                       sc::SchedulerStore store(workspace.path());
                       require(store.save_schedule("t1", "j1", "interval", "every 1h",
                                                   common::from_unix_seconds(1900000000))
                                   .ok(),
                               "save");
                     }
                     sc::SchedulerStore reopened(workspace.path());
                     auto row = reopened.get_schedule("t1");
                     require(row.ok() && row.value().has_value(), "row survives reopen");
                     require(row.value()->next_run_time ==
                                 std::optional(common::from_unix_seconds(1900000000)),
                             "next run time survives");
                   }});
}
