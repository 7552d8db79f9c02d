#include "tasktide/scheduler/job_engine.hpp"

#include "tasktide/observability/global.hpp"

#include <algorithm>
#include <exception>

namespace tasktide::scheduler {

JobEngine::JobEngine(JobEngineConfig config) : config_(config) {
  if (config_.worker_threads == 0) {
    config_.worker_threads = 1;
  }
  if (config_.max_instances == 0) {
    config_.max_instances = 1;
  }
}

JobEngine::~JobEngine() { shutdown(); }

JobInfo JobEngine::to_info(const Job &job) {
  return JobInfo{.id = job.id, .trigger = job.trigger, .next_run_time = job.next_run_time};
}

common::Result<JobInfo> JobEngine::add_job(const std::string &id, TriggerDescriptor trigger,
                                           JobCallback callback, const bool replace_existing) {
  if (!callback) {
    return common::Result<JobInfo>::failure("job callback must not be empty");
  }

  const auto next = next_fire_time(trigger, std::nullopt, common::Clock::now());
  if (!next.has_value()) {
    return common::Result<JobInfo>::failure("trigger for job " + id + " will never fire");
  }

  auto job = std::make_shared<Job>();
  job->id = id;
  job->trigger = std::move(trigger);
  job->callback = std::move(callback);
  job->next_run_time = next;

  JobInfo info = to_info(*job);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.contains(id) && !replace_existing) {
      return common::Result<JobInfo>::failure("job " + id + " already exists");
    }
    jobs_[id] = std::move(job);
  }
  timer_cv_.notify_all();
  return common::Result<JobInfo>::success(std::move(info));
}

common::Result<bool> JobEngine::remove_job(const std::string &id) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = jobs_.erase(id) > 0;
  }
  if (removed) {
    timer_cv_.notify_all();
  }
  return common::Result<bool>::success(removed);
}

std::optional<JobInfo> JobEngine::get_job(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return to_info(*it->second);
}

std::vector<JobInfo> JobEngine::get_jobs() const {
  std::vector<JobInfo> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(jobs_.size());
    for (const auto &[_, job] : jobs_) {
      out.push_back(to_info(*job));
    }
  }
  std::sort(out.begin(), out.end(), [](const JobInfo &a, const JobInfo &b) {
    return a.next_run_time < b.next_run_time;
  });
  return out;
}

void JobEngine::start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    workers_stopping_ = false;
  }
  workers_.reserve(config_.worker_threads);
  for (std::uint32_t i = 0; i < config_.worker_threads; ++i) {
    workers_.emplace_back([this]() { worker_loop(); });
  }
  timer_thread_ = std::thread([this]() { timer_loop(); });
}

void JobEngine::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  timer_cv_.notify_all();
  if (timer_thread_.joinable()) {
    timer_thread_.join();
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    workers_stopping_ = true;
  }
  queue_cv_.notify_all();
  for (auto &worker : workers_) {
    if (!worker.joinable()) {
      continue;
    }
    // A callback may shut the engine down from its own worker.
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else {
      worker.join();
    }
  }
  workers_.clear();
}

bool JobEngine::is_running() const { return running_; }

void JobEngine::timer_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    process_due_jobs(common::Clock::now());

    std::optional<common::TimePoint> wake;
    for (const auto &[_, job] : jobs_) {
      if (job->next_run_time.has_value() && (!wake.has_value() || *job->next_run_time < *wake)) {
        wake = job->next_run_time;
      }
    }

    if (wake.has_value()) {
      timer_cv_.wait_until(lock, *wake);
    } else {
      timer_cv_.wait(lock);
    }
  }
}

// Called with mutex_ held.
void JobEngine::process_due_jobs(const common::TimePoint now) {
  std::vector<std::string> exhausted;
  for (auto &[id, job] : jobs_) {
    if (!job->next_run_time.has_value() || *job->next_run_time > now) {
      continue;
    }

    std::vector<common::TimePoint> run_times;
    std::optional<common::TimePoint> next = job->next_run_time;
    while (next.has_value() && *next <= now) {
      if (config_.coalesce) {
        run_times.assign(1, *next);
      } else {
        run_times.push_back(*next);
      }
      next = next_fire_time(job->trigger, next, now);
    }
    job->next_run_time = next;

    for (const auto run_time : run_times) {
      const auto lateness = std::chrono::duration_cast<std::chrono::seconds>(now - run_time);
      if (lateness > config_.misfire_grace_time) {
        observability::record_job_missed(id, lateness);
        continue;
      }
      if (job->instances >= config_.max_instances) {
        observability::record_warning(
            "job_engine", "Execution of job " + id +
                              " skipped: maximum number of running instances reached (" +
                              std::to_string(config_.max_instances) + ")");
        continue;
      }
      dispatch(job);
    }

    if (!job->next_run_time.has_value()) {
      exhausted.push_back(id);
    }
  }

  for (const auto &id : exhausted) {
    jobs_.erase(id);
  }
}

// Called with mutex_ held; the run itself happens on a worker without it.
void JobEngine::dispatch(const std::shared_ptr<Job> &job) {
  ++job->instances;
  enqueue([this, job]() {
    try {
      job->callback();
    } catch (const std::exception &e) {
      observability::record_error("job_engine",
                                  "Job " + job->id + " raised an exception: " + e.what());
    } catch (...) {
      observability::record_error("job_engine", "Job " + job->id + " raised an unknown exception");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    --job->instances;
  });
}

void JobEngine::enqueue(std::function<void()> work) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(work));
  }
  queue_cv_.notify_one();
}

void JobEngine::worker_loop() {
  while (true) {
    std::function<void()> work;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return workers_stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      work = std::move(queue_.front());
      queue_.pop_front();
    }
    work();
  }
}

} // namespace tasktide::scheduler
