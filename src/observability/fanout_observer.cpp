#include "tasktide/observability/fanout_observer.hpp"

#include <exception>
#include <iostream>

namespace tasktide::observability {

void FanoutObserver::add(std::unique_ptr<IObserver> sink) {
  if (sink == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

std::size_t FanoutObserver::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sinks_.size();
}

std::string FanoutObserver::sink_names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string names;
  for (const auto &sink : sinks_) {
    if (!names.empty()) {
      names += ",";
    }
    names += sink->name();
  }
  return names;
}

template <typename Fn> void FanoutObserver::dispatch(const char *operation, Fn &&fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &sink : sinks_) {
    try {
      fn(*sink);
    } catch (const std::exception &ex) {
      std::cerr << "[ERROR] observability: sink " << sink->name() << " failed in " << operation
                << ": " << ex.what() << "\n";
    }
  }
}

void FanoutObserver::record_event(const ObserverEvent &event) {
  dispatch("record_event", [&event](IObserver &sink) { sink.record_event(event); });
}

void FanoutObserver::record_metric(const ObserverMetric &metric) {
  dispatch("record_metric", [&metric](IObserver &sink) { sink.record_metric(metric); });
}

void FanoutObserver::flush() {
  dispatch("flush", [](IObserver &sink) { sink.flush(); });
}

} // namespace tasktide::observability
