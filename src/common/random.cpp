#include "rmount/common/random.hpp"

#include <iomanip>
#include <openssl/rand.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace rmount::common {

namespace {

void fill_random(unsigned char *data, const std::size_t size) {
  if (RAND_bytes(data, static_cast<int>(size)) != 1) {
    throw std::runtime_error("RAND_bytes failed to produce random data");
  }
}

} // namespace

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  fill_random(data.data(), data.size());

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

std::string random_uuid() {
  unsigned char data[16];
  fill_random(data, sizeof(data));
  data[6] = static_cast<unsigned char>((data[6] & 0x0F) | 0x40);
  data[8] = static_cast<unsigned char>((data[8] & 0x3F) | 0x80);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (int i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace rmount::common
