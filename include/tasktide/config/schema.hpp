#pragma once

#include <cstdint>
#include <string>

namespace tasktide::config {

struct SchedulerConfig {
  std::string persistence_path = "~/.tasktide/scheduler";
  std::uint32_t max_instances = 3;
  std::uint64_t misfire_grace_seconds = 60;
  bool coalesce = true;
  std::uint32_t worker_threads = 8;
  std::uint32_t retention_days = 30;
  std::uint32_t cleanup_hour = 0;
  std::string tasks_file = "tasks.toml";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SchedulerConfig scheduler;
  ObservabilityConfig observability;
};

} // namespace tasktide::config
