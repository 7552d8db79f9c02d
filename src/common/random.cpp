#include "tasktide/common/random.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace tasktide::common {

Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (bytes > 0 && RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return Result<std::string>::failure("RAND_bytes failed");
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return Result<std::string>::success(stream.str());
}

} // namespace tasktide::common
