#include "tasktide/scheduler/task_registry.hpp"

#include "tasktide/common/fs.hpp"
#include "tasktide/common/toml.hpp"

#include <algorithm>
#include <set>

namespace tasktide::scheduler {

void InMemoryTaskRegistry::add(TaskRecord record) {
  record.updated_at = common::Clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  tasks_[record.id] = std::move(record);
}

bool InMemoryTaskRegistry::remove(const std::string &task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.erase(task_id) > 0;
}

std::vector<TaskRecord> InMemoryTaskRegistry::list() const {
  std::vector<TaskRecord> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(tasks_.size());
    for (const auto &[_, record] : tasks_) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const TaskRecord &a, const TaskRecord &b) { return a.id < b.id; });
  return out;
}

bool InMemoryTaskRegistry::exists(const std::string &task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.contains(task_id);
}

std::optional<TaskRecord> InMemoryTaskRegistry::get(const std::string &task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryTaskRegistry::update(const std::string &task_id,
                                  const std::function<void(TaskRecord &)> &mutator) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return false;
  }
  mutator(it->second);
  it->second.updated_at = common::Clock::now();
  return true;
}

common::Result<std::vector<TaskDefinition>> parse_task_definitions(const std::string &content) {
  auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<std::vector<TaskDefinition>>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  std::set<std::string> ids;
  for (const auto &key : doc.keys_with_prefix("tasks.")) {
    const std::string rest = key.substr(std::string("tasks.").size());
    const auto dot = rest.rfind('.');
    if (dot == std::string::npos || dot == 0) {
      continue;
    }
    ids.insert(rest.substr(0, dot));
  }

  std::vector<TaskDefinition> out;
  out.reserve(ids.size());
  for (const auto &id : ids) {
    const std::string prefix = "tasks." + id + ".";
    TaskDefinition definition;
    definition.id = id;
    definition.command = common::trim(doc.get_string(prefix + "command"));
    if (definition.command.empty()) {
      return common::Result<std::vector<TaskDefinition>>::failure("task " + id +
                                                                  " has no command");
    }
    const std::string schedule = common::trim(doc.get_string(prefix + "schedule"));
    if (!schedule.empty()) {
      definition.schedule = schedule;
    }
    out.push_back(std::move(definition));
  }
  return common::Result<std::vector<TaskDefinition>>::success(std::move(out));
}

common::Result<std::vector<TaskDefinition>>
load_task_definitions(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<std::vector<TaskDefinition>>::failure(content.error());
  }
  return parse_task_definitions(content.value());
}

} // namespace tasktide::scheduler
