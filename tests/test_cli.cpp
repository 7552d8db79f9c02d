#include "test_framework.hpp"

#include "tasktide/cli/commands.hpp"
#include "tasktide/config/config.hpp"
#include "tasktide/scheduler/store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

int run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = args;
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }
  return tasktide::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

struct StreamCapture {
  std::ostream &stream;
  std::ostringstream buffer;
  std::streambuf *old;

  explicit StreamCapture(std::ostream &target) : stream(target), old(target.rdbuf()) {
    stream.rdbuf(buffer.rdbuf());
  }
  ~StreamCapture() { stream.rdbuf(old); }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  ConfigOverrideGuard() : old_override(tasktide::config::config_path_override()) {}
  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      tasktide::config::set_config_path_override(*old_override);
    } else {
      tasktide::config::clear_config_path_override();
    }
  }
};

// Writes a config that keeps all state inside the workspace.
std::string write_config(const tasktide::testing::TempWorkspace &workspace) {
  workspace.create_file("config.toml", "[scheduler]\npersistence_path = \"" +
                                           (workspace.path() / "scheduler").string() +
                                           "\"\n\n[observability]\nbackend = \"none\"\n");
  return (workspace.path() / "config.toml").string();
}

} // namespace

void register_cli_tests(std::vector<tasktide::tests::TestCase> &tests) {
  using tasktide::tests::require;

  tests.push_back({"cli_version_and_help", [] {
                     StreamCapture out(std::cout);
                     require(run_cli({"tasktide", "version"}) == 0, "version");
                     require(out.buffer.str().find("tasktide ") == 0, "version text");
                     require(run_cli({"tasktide", "help"}) == 0, "help");
                     require(run_cli({"tasktide", "frobnicate"}) == 1, "unknown command");
                   }});

  tests.push_back({"cli_config_path_honors_override", [] {
                     tasktide::testing::TempWorkspace workspace;
                     const ConfigOverrideGuard guard;
                     const std::string config = write_config(workspace);
                     StreamCapture out(std::cout);
                     require(run_cli({"tasktide", "--config", config, "config-path"}) == 0,
                             "config-path");
                     require(out.buffer.str() == config + "\n", out.buffer.str());
                     require(run_cli({"tasktide", "--config"}) == 1, "missing value");
                   }});

  tests.push_back({"cli_describe_prints_next_fires", [] {
                     StreamCapture out(std::cout);
                     StreamCapture err(std::cerr);
                     require(run_cli({"tasktide", "describe", "every", "2h", "--next", "3"}) == 0,
                             "describe interval");
                     const std::string text = out.buffer.str();
                     require(text.find("Every 2 hours") != std::string::npos, text);
                     require(text.find("seconds: 7200") != std::string::npos, text);
                     std::size_t nexts = 0;
                     for (std::size_t pos = text.find("next:"); pos != std::string::npos;
                          pos = text.find("next:", pos + 1)) {
                       ++nexts;
                     }
                     require(nexts == 3, "three fire times");
                     require(run_cli({"tasktide", "describe", "bogus"}) == 1, "bad spec");
                     require(run_cli({"tasktide", "describe"}) == 1, "missing spec");
                   }});

  tests.push_back({"cli_history_commands_use_store", [] {
                     tasktide::testing::TempWorkspace workspace;
                     const ConfigOverrideGuard guard;
                     const std::string config = write_config(workspace);
                     {
                       tasktide::scheduler::SchedulerStore store(workspace.path() / "scheduler");
                       require(store.save_schedule("t1", "job", "interval", "every 1h",
                                                   std::nullopt)
                                   .ok(),
                               "seed schedule");
                       require(store
                                   .log_task_run("t1", tasktide::scheduler::RUN_STATUS_COMPLETED,
                                                 tasktide::common::Clock::now() -
                                                     std::chrono::hours(24 * 90))
                                   .ok(),
                               "seed old run");
                     }

                     StreamCapture out(std::cout);
                     StreamCapture err(std::cerr);
                     require(run_cli({"tasktide", "--config", config, "schedules"}) == 0,
                             "schedules");
                     require(out.buffer.str().find("t1 | interval | every 1h | Every 1 hour") !=
                                 std::string::npos,
                             out.buffer.str());
                     require(run_cli({"tasktide", "--config", config, "runs", "t1"}) == 0, "runs");
                     require(run_cli({"tasktide", "--config", config, "runs"}) == 1,
                             "runs needs a task");
                     require(run_cli({"tasktide", "--config", config, "history", "--limit", "x"}) ==
                                 1,
                             "bad limit");
                     require(run_cli({"tasktide", "--config", config, "cleanup", "--days", "30"}) ==
                                 0,
                             "cleanup");
                     require(out.buffer.str().find("Deleted 1 run(s)") != std::string::npos,
                             out.buffer.str());
                     require(run_cli({"tasktide", "--config", config, "migrate"}) == 0, "migrate");
                     require(out.buffer.str().find("Nothing to migrate") != std::string::npos,
                             "no legacy file");
                   }});
}
