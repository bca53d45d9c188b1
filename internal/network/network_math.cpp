#include "network_math.hpp"

#include <arpa/inet.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cstring>

#include "internal/util/errors.hpp"
#include "internal/util/random_id.hpp"

namespace proxicloud::network {

using proxicloud::util::ValidationError;

namespace {

constexpr uint64_t kDhcpMinBlock   = 10;
constexpr uint64_t kDhcpMinOffset  = 10;
constexpr uint64_t kDhcpBlockPct   = 40;
constexpr uint64_t kDhcpOffsetPct  = 60;
constexpr size_t   kSdnIdHexChars  = 5;

std::string_view Trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::optional<int> ParsePrefixLength(std::string_view text, int max_len) {
  if (text.empty() || text.size() > 3) {
    return std::nullopt;
  }

  int value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }

  if (value > max_len) {
    return std::nullopt;
  }
  return value;
}

// Byte-wise mask for the prefix: 0xFF for network bits, 0x00 for host bits.
uint8_t MaskByte(int prefix_len, size_t index) {
  const int bits = prefix_len - static_cast<int>(index) * 8;
  if (bits >= 8) return 0xFF;
  if (bits <= 0) return 0x00;
  return static_cast<uint8_t>(0xFF << (8 - bits));
}

IpPrefix ParseSubnetOrThrow(std::string_view subnet) {
  auto prefix = ParseCIDR(subnet);
  if (!prefix) {
    throw ValidationError("invalid subnet CIDR: " + std::string(subnet));
  }
  return *prefix;
}

IpAddress ParseGatewayOrThrow(std::string_view gateway) {
  auto ip = ParseIP(gateway);
  if (!ip) {
    throw ValidationError("invalid gateway IP address: " + std::string(gateway));
  }
  return *ip;
}

std::string Sha256Hex(std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;

  if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 digest failed");
  }
  return proxicloud::util::ToHex(digest, digest_len);
}

} // namespace

bool IpAddress::operator==(const IpAddress& other) const {
  return family == other.family && std::memcmp(bytes.data(), other.bytes.data(), Size()) == 0;
}

// ------------------------------------------------------------
// Parsing / formatting
// ------------------------------------------------------------

std::optional<IpAddress> ParseIP(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  const std::string buf(text);
  IpAddress         ip;

  if (buf.find(':') == std::string::npos) {
    ip.family = Family::kIPv4;
    if (inet_pton(AF_INET, buf.c_str(), ip.bytes.data()) != 1) {
      return std::nullopt;
    }
    return ip;
  }

  ip.family = Family::kIPv6;
  if (inet_pton(AF_INET6, buf.c_str(), ip.bytes.data()) != 1) {
    return std::nullopt;
  }
  return ip;
}

std::optional<IpPrefix> ParseCIDR(std::string_view text) {
  const auto slash = text.find('/');
  if (slash == std::string_view::npos) {
    return std::nullopt;
  }

  auto ip = ParseIP(text.substr(0, slash));
  if (!ip) {
    return std::nullopt;
  }

  const int  max_len = ip->family == Family::kIPv4 ? 32 : 128;
  const auto len     = ParsePrefixLength(text.substr(slash + 1), max_len);
  if (!len) {
    return std::nullopt;
  }

  return IpPrefix{*ip, *len};
}

IpAddress NetworkAddress(const IpPrefix& prefix) {
  IpAddress net = prefix.address;
  for (size_t i = 0; i < net.Size(); ++i) {
    net.bytes[i] &= MaskByte(prefix.prefix_len, i);
  }
  return net;
}

IpAddress BroadcastAddress(const IpPrefix& prefix) {
  IpAddress bcast = NetworkAddress(prefix);
  for (size_t i = 0; i < bcast.Size(); ++i) {
    bcast.bytes[i] |= static_cast<uint8_t>(~MaskByte(prefix.prefix_len, i));
  }
  return bcast;
}

bool Contains(const IpPrefix& prefix, const IpAddress& ip) {
  if (ip.family != prefix.address.family) {
    return false;
  }
  for (size_t i = 0; i < ip.Size(); ++i) {
    const auto mask = MaskByte(prefix.prefix_len, i);
    if ((ip.bytes[i] & mask) != (prefix.address.bytes[i] & mask)) {
      return false;
    }
  }
  return true;
}

std::string FormatIP(const IpAddress& ip) {
  char buf[INET6_ADDRSTRLEN] = {};
  const int af = ip.family == Family::kIPv4 ? AF_INET : AF_INET6;
  if (inet_ntop(af, ip.bytes.data(), buf, sizeof(buf)) == nullptr) {
    return {};
  }
  return buf;
}

uint32_t ToUint32(const IpAddress& ip) {
  return static_cast<uint32_t>(ip.bytes[0]) << 24 | static_cast<uint32_t>(ip.bytes[1]) << 16 |
         static_cast<uint32_t>(ip.bytes[2]) << 8 | static_cast<uint32_t>(ip.bytes[3]);
}

std::string FormatIPv4(uint32_t ip) {
  return std::to_string((ip >> 24) & 0xFF) + "." + std::to_string((ip >> 16) & 0xFF) + "." + std::to_string((ip >> 8) & 0xFF) + "." +
         std::to_string(ip & 0xFF);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

bool IsValidCIDR(std::string_view cidr) {
  auto prefix = ParseCIDR(cidr);
  if (!prefix) {
    return false;
  }
  return NetworkAddress(*prefix) == prefix->address;
}

void ValidateGatewayInSubnet(std::string_view subnet, std::string_view gateway) {
  if (subnet.empty()) {
    throw ValidationError("subnet cannot be empty");
  }
  if (gateway.empty()) {
    throw ValidationError("gateway cannot be empty");
  }

  const auto prefix = ParseSubnetOrThrow(subnet);
  const auto gw     = ParseGatewayOrThrow(gateway);

  if (!Contains(prefix, gw)) {
    throw ValidationError("gateway " + std::string(gateway) + " is not within subnet " + std::string(subnet));
  }

  const auto network = NetworkAddress(prefix);
  if (gw == network) {
    throw ValidationError("gateway cannot be the network address (" + FormatIP(network) + ")");
  }

  // IPv6 has no broadcast address.
  if (gw.family == Family::kIPv4) {
    const auto broadcast = BroadcastAddress(prefix);
    if (gw == broadcast) {
      throw ValidationError("gateway cannot be the broadcast address (" + FormatIP(broadcast) + ")");
    }
  }
}

// ------------------------------------------------------------
// DHCP range
// ------------------------------------------------------------

std::string CalculateDHCPRange(std::string_view subnet, std::string_view gateway) {
  const auto prefix = ParseSubnetOrThrow(subnet);
  const auto gw     = ParseGatewayOrThrow(gateway);

  if (prefix.address.family != Family::kIPv4) {
    throw ValidationError("only IPv4 subnets are supported");
  }
  if (gw.family != Family::kIPv4) {
    throw ValidationError("gateway must be an IPv4 address");
  }

  const int      host_bits = 32 - prefix.prefix_len;
  const uint64_t total     = uint64_t{1} << host_bits;
  if (total < 4) {
    throw ValidationError("subnet " + std::string(subnet) + " has no room for a DHCP range");
  }
  const uint64_t usable = total - 2;

  uint64_t size = std::min(std::max(usable * kDhcpBlockPct / 100, kDhcpMinBlock), usable);

  uint64_t offset = std::max(usable * kDhcpOffsetPct / 100, kDhcpMinOffset);
  if (offset + size - 1 > usable) {
    offset = std::max<uint64_t>(usable - size + 1, 1);
  }

  // Host offsets relative to the network address, 1..usable.
  uint64_t first = offset;
  uint64_t last  = offset + size - 1;

  const uint32_t network = ToUint32(NetworkAddress(prefix));
  if (Contains(prefix, gw)) {
    const uint64_t gw_offset = ToUint32(gw) - network;
    if (gw_offset >= first && gw_offset <= last) {
      if (gw_offset == first) {
        ++first;
      } else if (gw_offset == last) {
        --last;
      } else if (last - gw_offset >= gw_offset - first) {
        first = gw_offset + 1;
      } else {
        last = gw_offset - 1;
      }
    }
  }

  if (first >= last) {
    throw ValidationError("subnet " + std::string(subnet) + " has no room for a DHCP range");
  }

  const auto start_ip = FormatIPv4(network + static_cast<uint32_t>(first));
  const auto end_ip   = FormatIPv4(network + static_cast<uint32_t>(last));
  return "start-address=" + start_ip + ",end-address=" + end_ip;
}

DhcpRange ParseDHCPRange(std::string_view dhcp_range) {
  if (Trim(dhcp_range).empty()) {
    throw ValidationError("DHCP range is empty");
  }

  DhcpRange range;

  size_t pos = 0;
  while (pos <= dhcp_range.size()) {
    auto comma = dhcp_range.find(',', pos);
    if (comma == std::string_view::npos) {
      comma = dhcp_range.size();
    }

    const auto part = Trim(dhcp_range.substr(pos, comma - pos));
    const auto eq   = part.find('=');
    if (eq != std::string_view::npos) {
      const auto key   = Trim(part.substr(0, eq));
      const auto value = Trim(part.substr(eq + 1));

      if (key == "start-address") {
        range.start = std::string(value);
      } else if (key == "end-address") {
        range.end = std::string(value);
      }
    }

    pos = comma + 1;
  }

  if (range.start.empty() || range.end.empty()) {
    throw ValidationError("invalid DHCP range format: " + std::string(dhcp_range));
  }
  return range;
}

// ------------------------------------------------------------
// SDN naming
// ------------------------------------------------------------

std::string GenerateSDNIdentifier(std::string_view project_id, std::string_view project_name) {
  if (project_id.size() >= kSdnIdHexChars) {
    return "prj" + std::string(project_id.substr(0, kSdnIdHexChars));
  }
  return "prj" + Sha256Hex(project_name).substr(0, kSdnIdHexChars);
}

} // namespace proxicloud::network
