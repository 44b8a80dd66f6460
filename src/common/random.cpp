#include "almanac/common/random.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace almanac::common {

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    for (auto &byte : data) {
      byte = static_cast<unsigned char>(rng() & 0xFFu);
    }
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

} // namespace almanac::common
