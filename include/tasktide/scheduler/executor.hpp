#pragma once

#include "tasktide/common/result.hpp"
#include "tasktide/scheduler/task_registry.hpp"

#include <cstddef>
#include <string>

namespace tasktide::scheduler {

/// Performs the work behind a task id.
///
/// Implementations write the task outcome (`status`, `result`, `error`) into the registry
/// themselves. A non-ok Status, or an exception, means the executor itself broke down rather
/// than the task reporting a failure.
class ITaskExecutor {
public:
  virtual ~ITaskExecutor() = default;
  [[nodiscard]] virtual common::Status execute(const std::string &task_id) = 0;
};

/// Runs a task's description as a shell command, capturing stdout and stderr.
class ShellExecutor final : public ITaskExecutor {
public:
  explicit ShellExecutor(ITaskRegistry &registry, std::size_t max_output_bytes = 64 * 1024);

  [[nodiscard]] common::Status execute(const std::string &task_id) override;

private:
  ITaskRegistry &registry_;
  std::size_t max_output_bytes_;
};

} // namespace tasktide::scheduler
