#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace proxicloud::network {

/*
  Address math for project networks.

  Pure functions, no I/O. Validation failures are reported by throwing
  util::ValidationError, predicates return bool.
*/

enum class Family {
  kIPv4,
  kIPv6,
};

struct IpAddress {
  Family                   family = Family::kIPv4;
  std::array<uint8_t, 16>  bytes{};

  size_t Size() const {
    return family == Family::kIPv4 ? 4 : 16;
  }

  bool operator==(const IpAddress& other) const;
};

struct IpPrefix {
  IpAddress address;
  int       prefix_len = 0;
};

struct DhcpRange {
  std::string start;
  std::string end;
};

std::optional<IpAddress> ParseIP(std::string_view text);
std::optional<IpPrefix>  ParseCIDR(std::string_view text);

IpAddress   NetworkAddress(const IpPrefix& prefix);
IpAddress   BroadcastAddress(const IpPrefix& prefix);
bool        Contains(const IpPrefix& prefix, const IpAddress& ip);
std::string FormatIP(const IpAddress& ip);

uint32_t    ToUint32(const IpAddress& ip);
std::string FormatIPv4(uint32_t ip);

// True only when the address part is the network address of the prefix:
// "10.0.1.0/24" is valid, "10.0.1.5/24" is not.
bool IsValidCIDR(std::string_view cidr);

// Gateway must lie inside the subnet and be neither its network nor (IPv4)
// its broadcast address.
void ValidateGatewayInSubnet(std::string_view subnet, std::string_view gateway);

/*
  DHCP pool for an IPv4 subnet, formatted for the SDN subnet "dhcp-range"
  option: "start-address=<ip>,end-address=<ip>".

  With N usable hosts the pool holds 40% of N (at least 10, at most N) and
  starts at host offset 60% of N (at least 10), pulled back so it ends no
  later than the last usable host. The gateway is kept out of the pool.
*/
std::string CalculateDHCPRange(std::string_view subnet, std::string_view gateway);

DhcpRange ParseDHCPRange(std::string_view dhcp_range);

// "prj" + first 5 chars of the project ID, or of SHA-256(name) when the ID
// is shorter than 5 chars. Used as both zone and VNet name.
std::string GenerateSDNIdentifier(std::string_view project_id, std::string_view project_name);

} // namespace proxicloud::network
