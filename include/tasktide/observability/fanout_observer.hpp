#pragma once

#include "tasktide/observability/observer.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tasktide::observability {

/// Forwards to every sink in insertion order. A sink that throws is reported on stderr and
/// skipped for that record; the remaining sinks still receive it.
class FanoutObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> sink);
  [[nodiscard]] std::size_t size() const;
  /// Comma-separated sink names, e.g. `log,noop`.
  [[nodiscard]] std::string sink_names() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "fanout"; }

private:
  template <typename Fn> void dispatch(const char *operation, Fn &&fn);

  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<IObserver>> sinks_;
};

} // namespace tasktide::observability
