#pragma once

#include "tasktide/config/schema.hpp"
#include "tasktide/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tasktide::observability {

/// Lower-cased, de-duplicated backend names from a comma-separated list; blanks dropped.
[[nodiscard]] std::vector<std::string> parse_backends(const std::string &backend);

/// `none`/`noop` or an empty list give a no-op observer; several backends give a fan-out.
/// Unrecognized names fall back to the log backend.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace tasktide::observability
