#pragma once

#include "tasktide/config/schema.hpp"
#include "tasktide/observability/observer.hpp"
#include "tasktide/scheduler/events.hpp"
#include "tasktide/scheduler/executor.hpp"
#include "tasktide/scheduler/task_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tasktide::testing {

config::Config mock_config();

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

config::Config temp_config(const TempWorkspace &workspace);

/// Polls `predicate` until it holds or `timeout` passes.
bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

enum class ScriptedOutcome { Complete, Fail, Throw, ThrowUnknown, ErrorStatus };

/// Executor whose per-task behavior is set by the test. Writes the task outcome into the
/// registry the way a real executor would.
class ScriptedExecutor final : public scheduler::ITaskExecutor {
public:
  explicit ScriptedExecutor(scheduler::ITaskRegistry &registry);

  void set_outcome(const std::string &task_id, ScriptedOutcome outcome);
  void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

  [[nodiscard]] common::Status execute(const std::string &task_id) override;

  [[nodiscard]] std::size_t calls(const std::string &task_id) const;
  [[nodiscard]] std::size_t max_concurrent() const { return max_concurrent_; }

private:
  scheduler::ITaskRegistry &registry_;
  mutable std::mutex mutex_;
  std::map<std::string, ScriptedOutcome> outcomes_;
  std::map<std::string, std::size_t> calls_;
  std::atomic<std::chrono::milliseconds> delay_{std::chrono::milliseconds(0)};
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> max_concurrent_{0};
};

class RecordingListener final : public scheduler::ISchedulerListener {
public:
  void on_event(const scheduler::SchedulerEvent &event) override;

  [[nodiscard]] std::vector<scheduler::SchedulerEvent> events() const;
  [[nodiscard]] std::vector<std::string> types() const;
  [[nodiscard]] std::size_t count(const std::string &type) const;
  bool wait_for(const std::string &type, std::size_t count,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) const;
  void clear();

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::vector<scheduler::SchedulerEvent> events_;
};

class ThrowingListener final : public scheduler::ISchedulerListener {
public:
  void on_event(const scheduler::SchedulerEvent &event) override;
};

struct ObservationLog {
  std::mutex mutex;
  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;

  template <typename T> std::size_t count() {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t n = 0;
    for (const auto &event : events) {
      if (std::holds_alternative<T>(event)) {
        ++n;
      }
    }
    return n;
  }
};

class RecordingObserver final : public observability::IObserver {
public:
  explicit RecordingObserver(std::shared_ptr<ObservationLog> log) : log_(std::move(log)) {}

  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<ObservationLog> log_;
};

/// Installs a RecordingObserver as the global observer for the guard's lifetime.
class ObserverGuard {
public:
  ObserverGuard();
  ~ObserverGuard();

  ObserverGuard(const ObserverGuard &) = delete;
  ObserverGuard &operator=(const ObserverGuard &) = delete;

  [[nodiscard]] ObservationLog &log() { return *log_; }

private:
  std::shared_ptr<ObservationLog> log_;
};

scheduler::TaskRecord make_task(const std::string &id, const std::string &command = "true");

} // namespace tasktide::testing
