#pragma once

#include <cstddef>
#include <string>

namespace almanac::common {

/// Lowercase hex string built from `bytes` bytes of OpenSSL randomness.
[[nodiscard]] std::string random_hex(std::size_t bytes);

} // namespace almanac::common
