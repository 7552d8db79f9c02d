#pragma once

#include "tasktide/common/result.hpp"
#include "tasktide/common/time.hpp"

#include <filesystem>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tasktide::scheduler {

inline constexpr const char *TASK_STATUS_PENDING = "pending";
inline constexpr const char *TASK_STATUS_RUNNING = "running";
inline constexpr const char *TASK_STATUS_COMPLETED = "completed";
inline constexpr const char *TASK_STATUS_FAILED = "failed";

struct TaskRecord {
  std::string id;
  std::string description;
  std::string status = TASK_STATUS_PENDING;
  double progress = 0.0;
  std::optional<std::string> result;
  std::optional<std::string> error;
  std::optional<std::string> schedule;
  std::optional<common::TimePoint> next_run_time;
  common::TimePoint updated_at{};
};

/// Lookup and mutation of the tasks the scheduler runs; owned outside the scheduler.
class ITaskRegistry {
public:
  virtual ~ITaskRegistry() = default;

  [[nodiscard]] virtual bool exists(const std::string &task_id) const = 0;
  [[nodiscard]] virtual std::optional<TaskRecord> get(const std::string &task_id) const = 0;
  /// Applies `mutator` atomically; false when the task does not exist.
  virtual bool update(const std::string &task_id,
                      const std::function<void(TaskRecord &)> &mutator) = 0;
};

class InMemoryTaskRegistry final : public ITaskRegistry {
public:
  void add(TaskRecord record);
  bool remove(const std::string &task_id);
  [[nodiscard]] std::vector<TaskRecord> list() const;

  [[nodiscard]] bool exists(const std::string &task_id) const override;
  [[nodiscard]] std::optional<TaskRecord> get(const std::string &task_id) const override;
  bool update(const std::string &task_id,
              const std::function<void(TaskRecord &)> &mutator) override;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, TaskRecord> tasks_;
};

/// One `[tasks.<id>]` table of a tasks file.
struct TaskDefinition {
  std::string id;
  std::string command;
  std::optional<std::string> schedule;
};

/// Reads `[tasks.<id>]` tables with a `command` and an optional `schedule`, sorted by id.
[[nodiscard]] common::Result<std::vector<TaskDefinition>>
parse_task_definitions(const std::string &content);
[[nodiscard]] common::Result<std::vector<TaskDefinition>>
load_task_definitions(const std::filesystem::path &path);

} // namespace tasktide::scheduler
