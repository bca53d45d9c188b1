#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace proxicloud::proxmox {

/*
  SDN zone/VNet/subnet operations on the hypervisor.

  Every call either succeeds or throws util::ProvisioningError. Nothing is
  retried here; a failed call may or may not have taken effect remotely.
*/
class NetworkApi {
 public:
  virtual ~NetworkApi() = default;

  // Extra zone parameters passed through verbatim (e.g. "bridge", "mtu").
  using ZoneOptions = std::map<std::string, std::string>;

  virtual void CreateZone(const std::string& zone, const std::string& type, const ZoneOptions& options, bool dhcp_enabled) = 0;
  virtual void CreateVNet(const std::string& vnet, const std::string& zone, int32_t vlan_tag)                             = 0;
  virtual void CreateSubnet(const std::string& vnet, const std::string& cidr, const std::string& gateway, bool snat,
                            const std::string& dhcp_range)                                                                = 0;

  virtual void DeleteSubnet(const std::string& vnet, const std::string& cidr) = 0;
  virtual void DeleteVNet(const std::string& vnet)                            = 0;
  virtual void DeleteZone(const std::string& zone)                            = 0;

  // Commits pending SDN changes cluster-wide.
  virtual void ApplyConfig() = 0;
};

} // namespace proxicloud::proxmox
