#pragma once

#include "tasktide/common/result.hpp"
#include "tasktide/common/time.hpp"
#include "tasktide/scheduler/trigger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tasktide::scheduler {

struct JobEngineConfig {
  std::chrono::seconds misfire_grace_time{60};
  std::uint32_t max_instances = 3;
  bool coalesce = true;
  std::uint32_t worker_threads = 8;
};

using JobCallback = std::function<void()>;

struct JobInfo {
  std::string id;
  TriggerDescriptor trigger;
  std::optional<common::TimePoint> next_run_time;
};

/// Time-driven job table. A single timer thread sleeps until the earliest next run time and
/// hands due jobs to a fixed worker pool.
///
/// Fires later than `misfire_grace_time` are dropped, at most `max_instances` runs of one job
/// are in flight, and with `coalesce` a backlog of missed fires collapses into one run. Jobs
/// whose trigger is exhausted are removed after their last dispatch.
class JobEngine {
public:
  explicit JobEngine(JobEngineConfig config = {});
  ~JobEngine();

  JobEngine(const JobEngine &) = delete;
  JobEngine &operator=(const JobEngine &) = delete;

  [[nodiscard]] common::Result<JobInfo> add_job(const std::string &id, TriggerDescriptor trigger,
                                                JobCallback callback,
                                                bool replace_existing = false);
  /// false when no job has this id.
  [[nodiscard]] common::Result<bool> remove_job(const std::string &id);
  [[nodiscard]] std::optional<JobInfo> get_job(const std::string &id) const;
  [[nodiscard]] std::vector<JobInfo> get_jobs() const;

  void start();
  /// Stops the timer, lets in-flight and queued runs finish, then joins the workers.
  void shutdown();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] const JobEngineConfig &config() const { return config_; }

private:
  struct Job {
    std::string id;
    TriggerDescriptor trigger;
    JobCallback callback;
    std::optional<common::TimePoint> next_run_time;
    std::uint32_t instances = 0;
  };

  void timer_loop();
  void worker_loop();
  void process_due_jobs(common::TimePoint now);
  void dispatch(const std::shared_ptr<Job> &job);
  void enqueue(std::function<void()> work);
  [[nodiscard]] static JobInfo to_info(const Job &job);

  JobEngineConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable timer_cv_;
  std::map<std::string, std::shared_ptr<Job>> jobs_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<std::function<void()>> queue_;
  bool workers_stopping_ = false;

  std::thread timer_thread_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

} // namespace tasktide::scheduler
