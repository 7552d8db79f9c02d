#include "test_framework.hpp"

#include "tasktide/config/schema.hpp"
#include "tasktide/observability/factory.hpp"
#include "tasktide/observability/fanout_observer.hpp"
#include "tasktide/observability/global.hpp"
#include "tasktide/observability/log_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Captures std::cerr for the guard's lifetime.
class CerrCapture {
public:
  CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~CerrCapture() { std::cerr.rdbuf(old_); }

  CerrCapture(const CerrCapture &) = delete;
  CerrCapture &operator=(const CerrCapture &) = delete;

  [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *old_;
};

class ExplodingObserver final : public tasktide::observability::IObserver {
public:
  void record_event(const tasktide::observability::ObserverEvent &) override {
    throw std::runtime_error("sink offline");
  }
  void record_metric(const tasktide::observability::ObserverMetric &) override {
    throw std::runtime_error("sink offline");
  }
  [[nodiscard]] std::string_view name() const override { return "exploding"; }
};

} // namespace

void register_observability_tests(std::vector<tasktide::tests::TestCase> &tests) {
  using tasktide::tests::require;
  namespace obs = tasktide::observability;

  tests.push_back({"observer_factory_selects_backend", [] {
                     tasktide::config::ObservabilityConfig config;
                     config.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none is noop");
                     config.backend = "";
                     require(obs::create_observer(config)->name() == "noop", "empty is noop");
                     config.backend = " LOG ";
                     require(obs::create_observer(config)->name() == "log", "log");
                     config.backend = "whatever";
                     require(obs::create_observer(config)->name() == "log", "unknown falls back");
                     config.backend = "log,LOG, log";
                     require(obs::create_observer(config)->name() == "log", "duplicates collapse");
                   }});

  tests.push_back({"observer_factory_builds_fanout", [] {
                     require(obs::parse_backends(" Log, none,,log ") ==
                                 std::vector<std::string>{"log", "none"},
                             "parsed backends");
                     tasktide::config::ObservabilityConfig config{.backend = "log, none,,"};
                     auto observer = obs::create_observer(config);
                     require(observer->name() == "fanout", "fanout observer");
                     const auto *fanout = dynamic_cast<obs::FanoutObserver *>(observer.get());
                     require(fanout != nullptr && fanout->size() == 2, "two backends");
                     require(fanout->sink_names() == "log,noop", fanout->sink_names());
                   }});

  tests.push_back({"log_observer_writes_levels", [] {
                     obs::LogObserver observer;
                     CerrCapture capture;
                     observer.record_event(obs::InfoEvent{.component = "scheduler",
                                                          .message = "started"});
                     observer.record_event(
                         obs::JobMissedEvent{.job_id = "job-1", .lateness = std::chrono::seconds(90)});
                     observer.record_event(obs::ErrorEvent{.component = "store", .message = "disk"});
                     observer.record_metric(obs::ScheduledJobsMetric{.count = 4});
                     const std::string text = capture.text();
                     require(text.find("[INFO] scheduler: started") != std::string::npos, text);
                     require(text.find("[WARN] job.missed id=job-1 late_s=90") != std::string::npos,
                             text);
                     require(text.find("[ERROR] store: disk") != std::string::npos, text);
                     require(text.find("[DEBUG] metric.scheduled_jobs=4") != std::string::npos, text);
                   }});

  tests.push_back({"fanout_observer_reaches_every_sink", [] {
                     auto first = std::make_shared<tasktide::testing::ObservationLog>();
                     auto second = std::make_shared<tasktide::testing::ObservationLog>();
                     obs::FanoutObserver fanout;
                     fanout.add(std::make_unique<tasktide::testing::RecordingObserver>(first));
                     fanout.add(nullptr);
                     fanout.add(std::make_unique<obs::NoopObserver>());
                     fanout.add(std::make_unique<tasktide::testing::RecordingObserver>(second));
                     require(fanout.size() == 3, "null sink ignored");
                     fanout.record_event(obs::RunStartedEvent{.task_id = "t1"});
                     fanout.record_metric(obs::RunningTasksMetric{.count = 1});
                     require(first->count<obs::RunStartedEvent>() == 1, "first got event");
                     require(second->count<obs::RunStartedEvent>() == 1, "second got event");
                     require(first->metrics.size() == 1 && second->metrics.size() == 1,
                             "metrics fanned out");
                   }});

  tests.push_back({"fanout_observer_isolates_throwing_sink", [] {
                     auto log = std::make_shared<tasktide::testing::ObservationLog>();
                     obs::FanoutObserver fanout;
                     fanout.add(std::make_unique<ExplodingObserver>());
                     fanout.add(std::make_unique<tasktide::testing::RecordingObserver>(log));
                     CerrCapture capture;
                     fanout.record_event(obs::RunStartedEvent{.task_id = "t1"});
                     fanout.record_metric(obs::ScheduledJobsMetric{.count = 2});
                     require(log->count<obs::RunStartedEvent>() == 1, "later sink still called");
                     require(log->metrics.size() == 1, "metric delivered");
                     require(capture.text().find("sink exploding failed in record_event: sink offline") !=
                                 std::string::npos,
                             capture.text());
                   }});

  tests.push_back({"global_observer_helpers_record", [] {
                     tasktide::testing::ObserverGuard guard;
                     obs::record_info("c", "hello");
                     obs::record_warning("c", "careful");
                     obs::record_schedule_registered("t1", "job", "cron");
                     obs::record_run_finished("t1", "completed", std::chrono::milliseconds(12));
                     obs::record_cleanup(3, 30);
                     require(guard.log().count<obs::InfoEvent>() == 1, "info");
                     require(guard.log().count<obs::WarningEvent>() == 1, "warning");
                     require(guard.log().count<obs::ScheduleRegisteredEvent>() == 1, "registered");
                     require(guard.log().count<obs::RunFinishedEvent>() == 1, "finished");
                     require(guard.log().count<obs::CleanupEvent>() == 1, "cleanup");
                     require(guard.log().metrics.size() == 1, "run duration metric");
                   }});

  tests.push_back({"global_observer_absent_is_silent", [] {
                     obs::set_global_observer(nullptr);
                     require(obs::get_global_observer() == nullptr, "no observer");
                     obs::record_error("c", "dropped");
                   }});
}
