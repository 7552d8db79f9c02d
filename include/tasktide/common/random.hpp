#pragma once

#include "tasktide/common/result.hpp"

#include <cstddef>
#include <string>

namespace tasktide::common {

/// Hex encoding of `bytes` bytes from the OpenSSL CSPRNG.
[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

} // namespace tasktide::common
