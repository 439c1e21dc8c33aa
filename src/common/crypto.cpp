#include "beeptunnel/common/crypto.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace beeptunnel::common {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return Result<std::string>::failure("RAND_bytes failed");
  }
  return Result<std::string>::success(to_hex(data.data(), data.size()));
}

} // namespace beeptunnel::common
