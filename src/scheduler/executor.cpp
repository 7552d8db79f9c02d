#include "tasktide/scheduler/executor.hpp"

#include "tasktide/common/fs.hpp"

#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace tasktide::scheduler {

namespace {

struct CommandOutput {
  int exit_code = 0;
  std::string output;
};

common::Result<CommandOutput> run_capture_command(const std::string &command,
                                                  const std::size_t max_bytes) {
  std::array<char, 4096> buffer{};
  CommandOutput result;
  FILE *pipe = popen((command + " 2>&1").c_str(), "r");
  if (pipe == nullptr) {
    return common::Result<CommandOutput>::failure("failed to launch command");
  }

  while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
    if (result.output.size() < max_bytes) {
      result.output += buffer.data();
    }
  }
  if (result.output.size() > max_bytes) {
    result.output.resize(max_bytes);
  }

  const int status = pclose(pipe);
  if (status == -1) {
    return common::Result<CommandOutput>::failure("failed to wait for command");
  }
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return common::Result<CommandOutput>::success(std::move(result));
}

} // namespace

ShellExecutor::ShellExecutor(ITaskRegistry &registry, const std::size_t max_output_bytes)
    : registry_(registry), max_output_bytes_(max_output_bytes) {}

common::Status ShellExecutor::execute(const std::string &task_id) {
  const auto task = registry_.get(task_id);
  if (!task.has_value()) {
    return common::Status::error("unknown task: " + task_id);
  }
  const std::string command = common::trim(task->description);
  if (command.empty()) {
    return common::Status::error("task " + task_id + " has no command");
  }

  if (!registry_.update(task_id,
                        [](TaskRecord &record) { record.status = TASK_STATUS_RUNNING; })) {
    return common::Status::error("unknown task: " + task_id);
  }

  auto ran = run_capture_command(command, max_output_bytes_);
  if (!ran.ok()) {
    return common::Status::error(ran.error());
  }

  const CommandOutput &outcome = ran.value();
  const bool recorded = registry_.update(task_id, [&outcome](TaskRecord &record) {
    record.result = outcome.output;
    record.progress = 1.0;
    if (outcome.exit_code == 0) {
      record.status = TASK_STATUS_COMPLETED;
      record.error = std::nullopt;
    } else {
      record.status = TASK_STATUS_FAILED;
      record.error = outcome.exit_code < 0
                         ? std::string("command terminated by signal")
                         : "command failed with exit code " + std::to_string(outcome.exit_code);
    }
  });
  if (!recorded) {
    return common::Status::error("task " + task_id + " was removed while running");
  }
  return common::Status::success();
}

} // namespace tasktide::scheduler
