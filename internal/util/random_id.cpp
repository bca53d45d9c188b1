#include "random_id.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace proxicloud::util {

RandomID GenerateRandomID() {
  RandomID id{};

  if (RAND_bytes(id.data(), static_cast<int>(id.size())) != 1) {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    throw std::runtime_error(std::string("failed to generate random ID: ") + buf);
  }

  return id;
}

std::string ToHex(const uint8_t* data, size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

std::string ToString(const RandomID& id) {
  return ToHex(id.data(), id.size());
}

std::string NewProjectID() {
  return ToString(GenerateRandomID());
}

} // namespace proxicloud::util
