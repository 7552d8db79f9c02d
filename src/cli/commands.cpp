#include "tasktide/cli/commands.hpp"

#include "tasktide/common/fs.hpp"
#include "tasktide/common/time.hpp"
#include "tasktide/config/config.hpp"
#include "tasktide/observability/factory.hpp"
#include "tasktide/observability/global.hpp"
#include "tasktide/scheduler/events.hpp"
#include "tasktide/scheduler/executor.hpp"
#include "tasktide/scheduler/legacy.hpp"
#include "tasktide/scheduler/scheduler.hpp"
#include "tasktide/scheduler/store.hpp"
#include "tasktide/scheduler/task_registry.hpp"
#include "tasktide/scheduler/trigger.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tasktide::cli {

namespace {

std::string version_string() {
#ifdef TASKTIDE_VERSION
  std::string version = TASKTIDE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "tasktide " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::string out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out += ' ';
    }
    out += args[i];
  }
  return out;
}

bool parse_count(const std::string &raw, std::uint64_t &out) {
  const char *first = raw.data();
  const char *last = raw.data() + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return !raw.empty() && ec == std::errc() && ptr == last;
}

// Option value as a positive count; `fallback` when absent.
bool take_count_option(std::vector<std::string> &args, const std::string &name,
                       const std::uint64_t fallback, std::uint64_t &out) {
  std::string raw;
  if (!take_option(args, name, "", raw)) {
    out = fallback;
    return true;
  }
  if (!parse_count(raw, out) || out == 0) {
    std::cerr << "invalid " << name << ": " << raw << "\n";
    return false;
  }
  return true;
}

std::string format_optional_time(const std::optional<common::TimePoint> &time_point) {
  return time_point.has_value() ? common::format_local(*time_point, "%Y-%m-%d %H:%M:%S")
                                : std::string("-");
}

// Validated config with warnings printed; nullopt on error.
std::optional<config::Config> load_effective_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return std::nullopt;
  }
  const config::Config &effective = cfg.value();

  const auto validated = config::validate_config(effective);
  if (!validated.ok()) {
    std::cerr << "invalid configuration: " << validated.error() << "\n";
    return std::nullopt;
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return effective;
}

void print_run(const scheduler::TaskRun &run) {
  std::cout << run.id << " | " << run.task_id << " | " << run.status << " | "
            << common::format_local(run.start_time, "%Y-%m-%d %H:%M:%S") << " | "
            << format_optional_time(run.end_time);
  if (run.error.has_value()) {
    std::cout << " | " << *run.error;
  }
  std::cout << "\n";
}

int run_describe(std::vector<std::string> args) {
  std::uint64_t count = 0;
  if (!take_count_option(args, "--next", 5, count)) {
    return 1;
  }
  const std::string spec = join_tokens(args);
  if (spec.empty()) {
    std::cerr << "usage: tasktide describe <schedule> [--next N]\n";
    return 1;
  }

  const auto now = common::Clock::now();
  const auto trigger = scheduler::parse_schedule(spec, std::nullopt, now);
  if (!trigger.ok()) {
    std::cerr << trigger.error() << "\n";
    return 1;
  }

  std::cout << scheduler::human_readable(spec) << "\n";
  for (const auto &[key, value] : scheduler::trigger_info(trigger.value())) {
    std::cout << "  " << key << ": " << value << "\n";
  }

  std::optional<common::TimePoint> previous;
  for (std::uint64_t i = 0; i < count; ++i) {
    const auto next = scheduler::next_fire_time(trigger.value(), previous, now);
    if (!next.has_value()) {
      break;
    }
    std::cout << "  next: " << common::format_local(*next, "%Y-%m-%d %H:%M:%S") << "\n";
    previous = next;
  }
  return 0;
}

int run_schedules() {
  const auto cfg = load_effective_config();
  if (!cfg.has_value()) {
    return 1;
  }
  scheduler::SchedulerStore store(config::persistence_dir(*cfg));
  if (!store.init_status().ok()) {
    std::cerr << store.init_status().error() << "\n";
    return 1;
  }

  const auto schedules = store.get_all_schedules();
  if (!schedules.ok()) {
    std::cerr << schedules.error() << "\n";
    return 1;
  }
  if (schedules.value().empty()) {
    std::cout << "No schedules.\n";
    return 0;
  }
  for (const auto &schedule : schedules.value()) {
    std::cout << schedule.task_id << " | " << schedule.schedule_type << " | "
              << schedule.schedule_value << " | "
              << scheduler::human_readable(schedule.schedule_value) << " | next "
              << format_optional_time(schedule.next_run_time) << "\n";
  }
  return 0;
}

int run_runs(std::vector<std::string> args) {
  std::uint64_t limit = 0;
  if (!take_count_option(args, "--limit", 10, limit)) {
    return 1;
  }
  if (args.empty()) {
    std::cerr << "usage: tasktide runs <task_id> [--limit N]\n";
    return 1;
  }
  const auto cfg = load_effective_config();
  if (!cfg.has_value()) {
    return 1;
  }
  scheduler::SchedulerStore store(config::persistence_dir(*cfg));
  if (!store.init_status().ok()) {
    std::cerr << store.init_status().error() << "\n";
    return 1;
  }

  const auto runs = store.get_task_runs(args[0], static_cast<std::size_t>(limit));
  if (!runs.ok()) {
    std::cerr << runs.error() << "\n";
    return 1;
  }
  for (const auto &run : runs.value()) {
    print_run(run);
  }
  return 0;
}

int run_history(std::vector<std::string> args) {
  std::uint64_t limit = 0;
  if (!take_count_option(args, "--limit", 20, limit)) {
    return 1;
  }
  const auto cfg = load_effective_config();
  if (!cfg.has_value()) {
    return 1;
  }
  scheduler::SchedulerStore store(config::persistence_dir(*cfg));
  if (!store.init_status().ok()) {
    std::cerr << store.init_status().error() << "\n";
    return 1;
  }

  const auto runs = store.get_recent_runs(static_cast<std::size_t>(limit));
  if (!runs.ok()) {
    std::cerr << runs.error() << "\n";
    return 1;
  }
  for (const auto &run : runs.value()) {
    print_run(run);
  }
  return 0;
}

int run_cleanup(std::vector<std::string> args) {
  const auto cfg = load_effective_config();
  if (!cfg.has_value()) {
    return 1;
  }
  std::uint64_t days = 0;
  if (!take_count_option(args, "--days", cfg->scheduler.retention_days, days)) {
    return 1;
  }
  scheduler::SchedulerStore store(config::persistence_dir(*cfg));
  if (!store.init_status().ok()) {
    std::cerr << store.init_status().error() << "\n";
    return 1;
  }

  const auto deleted = store.cleanup_old_runs(static_cast<std::uint32_t>(days));
  if (!deleted.ok()) {
    std::cerr << deleted.error() << "\n";
    return 1;
  }
  std::cout << "Deleted " << deleted.value() << " run(s) older than " << days << " day(s)\n";
  return 0;
}

int run_migrate(std::vector<std::string> args) {
  const auto cfg = load_effective_config();
  if (!cfg.has_value()) {
    return 1;
  }
  std::string from;
  (void)take_option(args, "--from", "", from);

  // Opening the store imports its own legacy file.
  scheduler::SchedulerStore store(config::persistence_dir(*cfg));
  if (!store.init_status().ok()) {
    std::cerr << store.init_status().error() << "\n";
    return 1;
  }

  const std::filesystem::path source =
      from.empty() ? store.legacy_path() : std::filesystem::path(common::expand_path(from));
  const scheduler::LegacyMigrator migrator(source);
  if (!migrator.pending()) {
    std::cout << "Nothing to migrate at " << source.string() << "\n";
    return 0;
  }
  const auto report = migrator.migrate(store);
  if (!report.ok()) {
    std::cerr << report.error() << "\n";
    return 1;
  }
  std::cout << "Imported " << report.value().imported << " of " << report.value().entries
            << " schedule(s)";
  if (report.value().renamed) {
    std::cout << ", renamed to " << migrator.migrated_file().string();
  }
  std::cout << "\n";
  return 0;
}

int run_daemon(std::vector<std::string> args) {
  const auto cfg = load_effective_config();
  if (!cfg.has_value()) {
    return 1;
  }
  const bool print_events = take_flag(args, "--events");
  std::string duration_raw;
  (void)take_option(args, "--duration-secs", "", duration_raw);

  observability::set_global_observer(observability::create_observer(cfg->observability));

  std::vector<scheduler::TaskDefinition> definitions;
  const auto tasks_path = config::tasks_file_path(*cfg);
  if (!tasks_path.ok()) {
    std::cerr << tasks_path.error() << "\n";
    return 1;
  }
  if (std::filesystem::exists(tasks_path.value())) {
    auto loaded = scheduler::load_task_definitions(tasks_path.value());
    if (!loaded.ok()) {
      std::cerr << tasks_path.value().string() << ": " << loaded.error() << "\n";
      return 1;
    }
    definitions = std::move(loaded.value());
  } else {
    std::cerr << "warning: no tasks file at " << tasks_path.value().string() << "\n";
  }

  scheduler::SchedulerStore store(config::persistence_dir(*cfg));
  if (!store.init_status().ok()) {
    std::cerr << store.init_status().error() << "\n";
    return 1;
  }

  scheduler::InMemoryTaskRegistry registry;
  for (const auto &definition : definitions) {
    registry.add(scheduler::TaskRecord{.id = definition.id, .description = definition.command});
  }
  scheduler::ShellExecutor executor(registry);
  scheduler::TaskScheduler task_scheduler(store, registry, executor, cfg->scheduler);

  if (print_events) {
    auto output_mutex = std::make_shared<std::mutex>();
    task_scheduler.add_listener(std::make_shared<scheduler::CallbackListener>(
        [output_mutex](const scheduler::SchedulerEvent &event) {
          std::lock_guard<std::mutex> lock(*output_mutex);
          std::cout << scheduler::event_to_json(event) << "\n";
        }));
  }

  task_scheduler.start();

  // The tasks file wins over a persisted schedule that differs from it.
  for (const auto &definition : definitions) {
    if (!definition.schedule.has_value()) {
      continue;
    }
    const auto current = task_scheduler.get_task_schedule(definition.id);
    if (current.has_value() && current->schedule_value == *definition.schedule) {
      continue;
    }
    if (!task_scheduler.schedule_task(definition.id, *definition.schedule)) {
      std::cerr << "failed to schedule task " << definition.id << "\n";
    }
  }

  std::cout << "Scheduler started with " << task_scheduler.scheduled_count()
            << " schedule(s)\n";

  if (!duration_raw.empty()) {
    std::uint64_t duration = 0;
    if (!parse_count(duration_raw, duration)) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      task_scheduler.shutdown();
      return 1;
    }
    if (duration > 0) {
      std::this_thread::sleep_for(std::chrono::seconds(duration));
      task_scheduler.shutdown();
      return 0;
    }
  }

  std::cout << "Press Enter to stop daemon...\n";
  std::string line;
  std::getline(std::cin, line);
  task_scheduler.shutdown();
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "validate") {
    return load_effective_config().has_value() ? 0 : 1;
  }
  if (!args.empty() && args[0] != "show") {
    std::cerr << "unknown config subcommand: " << args[0] << "\n";
    return 1;
  }

  const auto cfg = load_effective_config();
  if (!cfg.has_value()) {
    return 1;
  }
  const auto &settings = cfg->scheduler;
  if (const auto path = config::config_path(); path.ok()) {
    std::cout << "Config: " << path.value().string() << "\n";
  }
  std::cout << "Persistence: " << config::persistence_dir(*cfg).string() << "\n";
  if (const auto tasks = config::tasks_file_path(*cfg); tasks.ok()) {
    std::cout << "Tasks file: " << tasks.value().string() << "\n";
  }
  std::cout << "Max instances: " << settings.max_instances << "\n";
  std::cout << "Misfire grace: " << settings.misfire_grace_seconds << "s\n";
  std::cout << "Coalesce: " << (settings.coalesce ? "true" : "false") << "\n";
  std::cout << "Worker threads: " << settings.worker_threads << "\n";
  std::cout << "Retention: " << settings.retention_days << " day(s), cleanup at "
            << settings.cleanup_hour << ":00\n";
  std::cout << "Observability: " << cfg->observability.backend << "\n";
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  tasktide" << RESET << DIM << "  persistent task scheduler"
            << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "tasktide [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  SCHEDULES" << RESET << "\n";
  std::cout << "  " << GREEN << "describe" << RESET << " SPEC" << DIM
            << "  Parse a schedule and show its next fire times" << RESET << "\n";
  std::cout << "  " << GREEN << "schedules" << RESET << DIM << "      List persisted schedules"
            << RESET << "\n";
  std::cout << "  " << GREEN << "daemon" << RESET << DIM
            << "         Run the tasks file until Enter is pressed" << RESET << "\n\n";

  std::cout << BOLD << "  HISTORY" << RESET << "\n";
  std::cout << "  " << GREEN << "runs" << RESET << " ID" << DIM << "        Recent runs of a task"
            << RESET << "\n";
  std::cout << "  " << GREEN << "history" << RESET << DIM << "        Recent runs of all tasks"
            << RESET << "\n";
  std::cout << "  " << GREEN << "cleanup" << RESET << DIM
            << "        Delete runs older than the retention window" << RESET << "\n";
  std::cout << "  " << GREEN << "migrate" << RESET << DIM
            << "        Import a legacy scheduled_tasks.json" << RESET << "\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM << "    Effective configuration"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config validate" << RESET << DIM << " Check the config file"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print the config file path"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Print the version" << RESET
            << "\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "describe") {
    return run_describe(std::move(args));
  }
  if (subcommand == "schedules") {
    return run_schedules();
  }
  if (subcommand == "runs") {
    return run_runs(std::move(args));
  }
  if (subcommand == "history") {
    return run_history(std::move(args));
  }
  if (subcommand == "cleanup") {
    return run_cleanup(std::move(args));
  }
  if (subcommand == "migrate") {
    return run_migrate(std::move(args));
  }
  if (subcommand == "daemon") {
    return run_daemon(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace tasktide::cli
