#include "test_framework.hpp"

#include "tasktide/common/fs.hpp"
#include "tasktide/common/toml.hpp"
#include "tasktide/config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = tasktide::config::config_path_override();
    if (next.has_value()) {
      tasktide::config::set_config_path_override(*next);
    } else {
      tasktide::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      tasktide::config::set_config_path_override(*old_override);
    } else {
      tasktide::config::clear_config_path_override();
    }
  }
};

// Isolated HOME with every variable the loader reads cleared.
struct IsolatedEnv {
  std::filesystem::path home;
  EnvGuard home_guard;
  EnvGuard config_path_guard{"TASKTIDE_CONFIG_PATH", std::nullopt};
  EnvGuard env_file_guard{"TASKTIDE_ENV_FILE", std::nullopt};
  EnvGuard persistence_guard{"TASKTIDE_PERSISTENCE_PATH", std::nullopt};
  EnvGuard legacy_persistence_guard{"SCHEDULER_PERSISTENCE_PATH", std::nullopt};
  EnvGuard max_instances_guard{"SCHEDULER_MAX_INSTANCES", std::nullopt};
  EnvGuard retention_guard{"SCHEDULER_RETENTION_DAYS", std::nullopt};
  ConfigOverrideGuard override_guard;

  explicit IsolatedEnv(std::filesystem::path path)
      : home(std::move(path)), home_guard("HOME", home.string()) {}
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("tasktide-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<tasktide::tests::TestCase> &tests) {
  using tasktide::tests::require;
  namespace cfg = tasktide::config;

  tests.push_back({"config_dir_creates_directory", [] {
                     const IsolatedEnv env(make_temp_home());
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     require(std::filesystem::exists(dir.value()), "config directory should exist");
                     require(dir.value() == env.home / ".tasktide", "under home");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const IsolatedEnv env(make_temp_home());
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &scheduler = loaded.value().scheduler;
                     require(scheduler.persistence_path == "~/.tasktide/scheduler",
                             "default persistence path");
                     require(scheduler.max_instances == 3, "default max instances");
                     require(scheduler.misfire_grace_seconds == 60, "default grace");
                     require(scheduler.coalesce, "default coalesce");
                     require(scheduler.retention_days == 30, "default retention");
                     require(loaded.value().observability.backend == "log", "default backend");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const IsolatedEnv env(make_temp_home());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     write_file(path.value(), R"(
[scheduler]
persistence_path = "/var/lib/tasktide"  # state lives here
max_instances = 5
misfire_grace_seconds = 120
coalesce = false
worker_threads = 2
retention_days = 7
cleanup_hour = 3
tasks_file = "jobs.toml"

[observability]
backend = "log,none"
)");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &scheduler = loaded.value().scheduler;
                     require(scheduler.persistence_path == "/var/lib/tasktide", "persistence");
                     require(scheduler.max_instances == 5, "max instances");
                     require(scheduler.misfire_grace_seconds == 120, "grace");
                     require(!scheduler.coalesce, "coalesce");
                     require(scheduler.worker_threads == 2, "workers");
                     require(scheduler.retention_days == 7, "retention");
                     require(scheduler.cleanup_hour == 3, "cleanup hour");
                     require(loaded.value().observability.backend == "log,none", "backend");

                     const auto tasks = cfg::tasks_file_path(loaded.value());
                     require(tasks.ok(), tasks.error());
                     require(tasks.value() == env.home / ".tasktide" / "jobs.toml",
                             "relative tasks file resolves to config dir");
                   }});

  tests.push_back({"load_config_invalid_toml_fails", [] {
                     const IsolatedEnv env(make_temp_home());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     write_file(path.value(), "[scheduler]\nthis is not toml\n");
                     require(!cfg::load_config().ok(), "parse error surfaces");
                   }});

  tests.push_back({"env_overrides_win_over_file", [] {
                     const IsolatedEnv env(make_temp_home());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     write_file(path.value(), "[scheduler]\nmax_instances = 5\n");
                     const EnvGuard legacy("SCHEDULER_PERSISTENCE_PATH", "/tmp/legacy-store");
                     const EnvGuard max("SCHEDULER_MAX_INSTANCES", "9");
                     const EnvGuard retention("SCHEDULER_RETENTION_DAYS", "not-a-number");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().scheduler.persistence_path == "/tmp/legacy-store",
                             "legacy variable honored");
                     require(loaded.value().scheduler.max_instances == 9, "max from env");
                     require(loaded.value().scheduler.retention_days == 30,
                             "unparsable env ignored");

                     const EnvGuard primary("TASKTIDE_PERSISTENCE_PATH", "/tmp/primary-store");
                     loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().scheduler.persistence_path == "/tmp/primary-store",
                             "primary variable wins");
                   }});

  tests.push_back({"dotenv_in_config_dir_is_loaded", [] {
                     const IsolatedEnv env(make_temp_home());
                     write_file(env.home / ".tasktide" / ".env",
                                "SCHEDULER_RETENTION_DAYS=\"14\"\n# comment\n");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().scheduler.retention_days == 14, "dotenv applied");
                   }});

  tests.push_back({"config_path_override_points_elsewhere", [] {
                     const IsolatedEnv env(make_temp_home());
                     const auto custom = env.home / "custom" / "tasktide.toml";
                     cfg::set_config_path_override(custom);
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == custom, "override used");
                     require(!cfg::config_exists(), "not written yet");
                   }});

  tests.push_back({"save_config_round_trips", [] {
                     const IsolatedEnv env(make_temp_home());
                     cfg::Config config;
                     config.scheduler.persistence_path = "/srv/state dir";
                     config.scheduler.max_instances = 2;
                     config.scheduler.coalesce = false;
                     config.scheduler.cleanup_hour = 4;
                     config.observability.backend = "none";
                     require(cfg::save_config(config).ok(), "save");
                     require(cfg::config_exists(), "file written");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().scheduler.persistence_path == "/srv/state dir",
                             "path with space");
                     require(loaded.value().scheduler.max_instances == 2, "max instances");
                     require(!loaded.value().scheduler.coalesce, "coalesce");
                     require(loaded.value().scheduler.cleanup_hour == 4, "cleanup hour");
                     require(loaded.value().observability.backend == "none", "backend");
                     const auto path = cfg::config_path();
                     require(!std::filesystem::exists(path.value().string() + ".tmp"),
                             "temp file renamed away");
                   }});

  tests.push_back({"validate_config_errors_and_warnings", [] {
                     cfg::Config config;
                     auto ok = cfg::validate_config(config);
                     require(ok.ok() && ok.value().empty(), "defaults are clean");

                     config.scheduler.max_instances = 0;
                     require(!cfg::validate_config(config).ok(), "zero instances");
                     config.scheduler.max_instances = 3;
                     config.scheduler.cleanup_hour = 24;
                     require(!cfg::validate_config(config).ok(), "hour out of range");
                     config.scheduler.cleanup_hour = 0;
                     config.scheduler.persistence_path = "  ";
                     require(!cfg::validate_config(config).ok(), "blank persistence path");
                     config.scheduler.persistence_path = "/tmp/x";

                     config.scheduler.misfire_grace_seconds = 0;
                     config.scheduler.worker_threads = 1;
                     config.observability.backend = "log,prometheus";
                     auto warned = cfg::validate_config(config);
                     require(warned.ok(), warned.error());
                     require(warned.value().size() == 3, "three warnings");
                   }});

  tests.push_back({"persistence_dir_expands_home", [] {
                     const IsolatedEnv env(make_temp_home());
                     cfg::Config config;
                     require(cfg::persistence_dir(config) == env.home / ".tasktide" / "scheduler",
                             "tilde expanded");
                   }});

  tests.push_back({"toml_parser_sections_and_values", [] {
                     auto doc = tasktide::common::parse_toml(R"(
top = 1
[a]
name = "x # y"
flag = true
big = 18446744073709551615
)");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_int("top", 0) == 1, "top level");
                     require(doc.value().get_string("a.name") == "x # y", "quoted hash");
                     require(doc.value().get_bool("a.flag", false), "bool");
                     require(doc.value().get_u64("a.big", 0) == 18446744073709551615ULL, "u64");
                     require(doc.value().keys_with_prefix("a.").size() == 3, "prefix keys");
                     require(!tasktide::common::parse_toml("[]\n").ok(), "empty section");
                   }});
}
