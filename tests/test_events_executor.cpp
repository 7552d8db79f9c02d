#include "test_framework.hpp"

#include "tasktide/common/json_util.hpp"
#include "tasktide/common/time.hpp"
#include "tasktide/scheduler/events.hpp"
#include "tasktide/scheduler/executor.hpp"
#include "tasktide/scheduler/task_registry.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_events_executor_tests(std::vector<tasktide::tests::TestCase> &tests) {
  using tasktide::tests::require;
  namespace sc = tasktide::scheduler;
  namespace common = tasktide::common;

  tests.push_back({"events_schedule_update_json", [] {
                     const auto next = common::parse_iso8601("2030-01-01T09:00:00");
                     require(next.ok(), next.error());
                     const sc::SchedulerEvent event = sc::ScheduleUpdateEvent{
                         .task_id = "t1",
                         .job_id = "task_t1_1",
                         .schedule_type = "cron",
                         .schedule_value = "cron:0 9 * * *",
                         .human_readable = "Cron schedule: 0 9 * * *",
                         .next_run_time = next.value(),
                     };
                     require(sc::event_type(event) == "schedule_update", "type");
                     const auto json = sc::event_to_json(event);
                     require(common::json_is_object(json), json);
                     const auto fields = common::json_parse_flat(json);
                     require(fields.at("type") == "schedule_update", "type field");
                     require(fields.at("task_id") == "t1", "task field");
                     const auto schedule = common::json_parse_flat(fields.at("schedule"));
                     require(schedule.at("job_id") == "task_t1_1", "job id");
                     require(schedule.at("human_readable") == "Cron schedule: 0 9 * * *",
                             "human text");
                     require(schedule.at("next_run_time") == "2030-01-01T09:00:00", "local iso");
                   }});

  tests.push_back({"events_finished_json_with_null_error", [] {
                     const auto now = common::Clock::now();
                     const sc::SchedulerEvent event = sc::TaskFinishedEvent{
                         .task_id = "t\"1", .status = "completed", .start_time = now,
                         .end_time = now};
                     const auto json = sc::event_to_json(event);
                     require(common::json_is_object(json), json);
                     const auto fields = common::json_parse_flat(json);
                     require(fields.at("task_id") == "t\"1", "escaped id");
                     require(fields.at("status") == "completed", "status");
                     require(fields.at("error") == "null", "null error");
                     require(sc::event_task_id(event) == "t\"1", "task id accessor");
                   }});

  tests.push_back({"events_removed_and_error_types", [] {
                     const sc::SchedulerEvent removed = sc::ScheduleRemovedEvent{.task_id = "x"};
                     require(sc::event_type(removed) == "schedule_removed", "removed");
                     require(sc::event_to_json(removed) ==
                                 R"({"type":"schedule_removed","task_id":"x"})",
                             sc::event_to_json(removed));
                     const sc::SchedulerEvent error = sc::TaskErrorEvent{
                         .task_id = "x", .error = "boom", .end_time = common::Clock::now()};
                     require(sc::event_type(error) == "task_error", "error type");
                     require(common::json_parse_flat(sc::event_to_json(error)).at("error") ==
                                 "boom",
                             "error text");
                   }});

  tests.push_back({"callback_listener_forwards_events", [] {
                     int seen = 0;
                     sc::CallbackListener listener(
                         [&seen](const sc::SchedulerEvent &) { ++seen; });
                     listener.on_event(sc::ScheduleRemovedEvent{.task_id = "x"});
                     require(seen == 1, "forwarded");
                   }});

  tests.push_back({"registry_update_and_list", [] {
                     sc::InMemoryTaskRegistry registry;
                     registry.add(tasktide::testing::make_task("b"));
                     registry.add(tasktide::testing::make_task("a"));
                     require(registry.exists("a") && !registry.exists("c"), "exists");
                     require(registry.update("a",
                                             [](sc::TaskRecord &record) { record.progress = 0.5; }),
                             "update existing");
                     require(!registry.update("c", [](sc::TaskRecord &) {}), "update missing");
                     require(registry.get("a")->progress == 0.5, "mutation applied");
                     const auto all = registry.list();
                     require(all.size() == 2 && all[0].id == "a", "sorted list");
                     require(registry.remove("a") && !registry.remove("a"), "remove once");
                   }});

  tests.push_back({"task_definitions_parse", [] {
                     const std::string content = R"(
[tasks.backup]
command = "tar czf /tmp/backup.tgz /srv"
schedule = "cron:0 2 * * *"

[tasks.ping]
command = "curl -s localhost # not a comment"
)";
                     auto parsed = sc::parse_task_definitions(content);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().size() == 2, "two tasks");
                     require(parsed.value()[0].id == "backup", "sorted by id");
                     require(parsed.value()[0].schedule ==
                                 std::optional<std::string>("cron:0 2 * * *"),
                             "schedule read");
                     require(parsed.value()[1].command == "curl -s localhost # not a comment",
                             "quoted hash kept");
                     require(!parsed.value()[1].schedule.has_value(), "unscheduled task");

                     require(!sc::parse_task_definitions("[tasks.empty]\nschedule = \"every 1h\"\n")
                                  .ok(),
                             "missing command rejected");
                   }});

  tests.push_back({"shell_executor_success", [] {
                     sc::InMemoryTaskRegistry registry;
                     registry.add(tasktide::testing::make_task("echo", "echo hello"));
                     sc::ShellExecutor executor(registry);
                     const auto status = executor.execute("echo");
                     require(status.ok(), status.error());
                     const auto task = registry.get("echo");
                     require(task->status == "completed", "completed");
                     require(task->result.has_value() &&
                                 task->result->find("hello") != std::string::npos,
                             "output captured");
                     require(!task->error.has_value(), "no error");
                     require(task->progress == 1.0, "progress done");
                   }});

  tests.push_back({"shell_executor_reports_exit_code", [] {
                     sc::InMemoryTaskRegistry registry;
                     registry.add(tasktide::testing::make_task("bad", "exit 3"));
                     sc::ShellExecutor executor(registry);
                     require(executor.execute("bad").ok(), "task failure is not executor failure");
                     const auto task = registry.get("bad");
                     require(task->status == "failed", "failed");
                     require(task->error == std::optional<std::string>(
                                                "command failed with exit code 3"),
                             "exit code reported");
                   }});

  tests.push_back({"shell_executor_rejects_missing_work", [] {
                     sc::InMemoryTaskRegistry registry;
                     registry.add(tasktide::testing::make_task("blank", "   "));
                     sc::ShellExecutor executor(registry);
                     require(!executor.execute("blank").ok(), "empty command");
                     require(!executor.execute("missing").ok(), "unknown task");
                   }});
}
