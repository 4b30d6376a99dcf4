#include "veilguard/common/random.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace veilguard::common {

namespace {

void fill_random(unsigned char *data, const std::size_t size) {
  if (RAND_bytes(data, static_cast<int>(size)) == 1) {
    return;
  }
  char reason[256] = {0};
  ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
  throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
}

std::string to_hex(const std::vector<unsigned char> &data) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

} // namespace

std::uint64_t random_below(const std::uint64_t bound) {
  if (bound <= 1) {
    return 0;
  }
  // Rejection sampling keeps the distribution uniform.
  const std::uint64_t limit = UINT64_MAX - (UINT64_MAX % bound);
  std::uint64_t value = 0;
  do {
    fill_random(reinterpret_cast<unsigned char *>(&value), sizeof(value));
  } while (value >= limit);
  return value % bound;
}

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  fill_random(data.data(), data.size());
  return to_hex(data);
}

std::string random_uuid_v4() {
  std::vector<unsigned char> data(16);
  fill_random(data.data(), data.size());
  data[6] = static_cast<unsigned char>((data[6] & 0x0FU) | 0x40U);
  data[8] = static_cast<unsigned char>((data[8] & 0x3FU) | 0x80U);

  const std::string hex = to_hex(data);
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace veilguard::common
