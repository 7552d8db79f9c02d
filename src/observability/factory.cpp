#include "tasktide/observability/factory.hpp"

#include "tasktide/common/fs.hpp"
#include "tasktide/observability/fanout_observer.hpp"
#include "tasktide/observability/log_observer.hpp"

#include <algorithm>
#include <sstream>

namespace tasktide::observability {

namespace {

std::unique_ptr<IObserver> single_backend(const std::string &backend) {
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::vector<std::string> parse_backends(const std::string &backend) {
  std::vector<std::string> names;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::to_lower(common::trim(part));
    if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
      names.push_back(name);
    }
  }
  return names;
}

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const auto backends = parse_backends(config.backend);
  if (backends.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (backends.size() == 1) {
    return single_backend(backends.front());
  }

  auto fanout = std::make_unique<FanoutObserver>();
  for (const auto &name : backends) {
    fanout->add(single_backend(name));
  }
  return fanout;
}

} // namespace tasktide::observability
