#pragma once

#include "tasktide/common/result.hpp"
#include "tasktide/scheduler/store.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace tasktide::scheduler {

struct LegacyMigrationReport {
  std::size_t entries = 0;
  std::size_t imported = 0;
  bool renamed = false;
};

/// One-shot importer for the flat `scheduled_tasks.json` format:
/// `{task_id: {job_id, trigger: {type, ...}, next_run_time}}`.
class LegacyMigrator {
public:
  explicit LegacyMigrator(std::filesystem::path legacy_file);

  [[nodiscard]] bool pending() const;
  [[nodiscard]] const std::filesystem::path &legacy_file() const { return legacy_file_; }
  [[nodiscard]] std::filesystem::path migrated_file() const;

  [[nodiscard]] common::Result<std::vector<Schedule>> read() const;

  /// Imports entries whose task_id is not yet stored, then renames the file with a
  /// `.migrated` suffix. On failure the file is left in place for the next attempt.
  [[nodiscard]] common::Result<LegacyMigrationReport> migrate(SchedulerStore &store) const;

  /// Reconstructs a schedule spec from a legacy trigger object, or `unknown`.
  [[nodiscard]] static std::string schedule_value_for(const std::string &trigger_json);
  [[nodiscard]] static std::string schedule_type_for(const std::string &trigger_json);

private:
  std::filesystem::path legacy_file_;
};

} // namespace tasktide::scheduler
