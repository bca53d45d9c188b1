#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace proxicloud::util {

/*
  Project IDs are 16 bytes from the OpenSSL CSPRNG, hex encoded (32 chars).
*/

using RandomID = std::array<uint8_t, 16>;

RandomID GenerateRandomID();

std::string ToHex(const uint8_t* data, size_t size);
std::string ToString(const RandomID& id);

// Convenience: GenerateRandomID() formatted with ToString().
std::string NewProjectID();

} // namespace proxicloud::util
