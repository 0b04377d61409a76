#include "sessionrelay/common/id.hpp"

#include <openssl/rand.h>

#include <array>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <vector>

namespace sessionrelay::common {

namespace {

void fill_random(unsigned char *data, const std::size_t size) {
  if (RAND_bytes(data, static_cast<int>(size)) == 1) {
    return;
  }
  static std::mutex fallback_mutex;
  static std::mt19937_64 fallback_rng{std::random_device{}()};
  std::lock_guard<std::mutex> lock(fallback_mutex);
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<unsigned char>(fallback_rng() & 0xFFU);
  }
}

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

std::string generate_uuid_v4() {
  std::array<unsigned char, 16> bytes{};
  fill_random(bytes.data(), bytes.size());
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  const std::string hex = to_hex(bytes.data(), bytes.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool looks_like_uuid(const std::string &value) {
  if (value.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (ch != '-') {
        return false;
      }
      continue;
    }
    if (std::isxdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
  }
  return true;
}

} // namespace sessionrelay::common
