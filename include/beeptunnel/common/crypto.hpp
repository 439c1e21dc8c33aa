#pragma once

#include "beeptunnel/common/result.hpp"

#include <cstddef>
#include <string>

namespace beeptunnel::common {

[[nodiscard]] std::string to_hex(const unsigned char *data, std::size_t size);

/// `bytes` random bytes from the OpenSSL CSPRNG, hex encoded.
[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

} // namespace beeptunnel::common
