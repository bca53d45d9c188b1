#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/proxmox/container_api.hpp"
#include "internal/proxmox/network_api.hpp"
#include "internal/util/errors.hpp"

namespace proxicloud::testing {

/*
  In-memory hypervisor for unit tests.

  Records every network call as "<Method> <args...>" and throws
  util::ProvisioningError for methods listed in fail_methods. NextVMID
  returns next_vmid.
*/
class FakeProxmox final : public proxmox::NetworkApi, public proxmox::ContainerApi {
 public:
  void CreateZone(const std::string& zone, const std::string& type, const ZoneOptions&, bool dhcp_enabled) override {
    Record("CreateZone", zone + " " + type + (dhcp_enabled ? " dhcp" : ""));
  }

  void CreateVNet(const std::string& vnet, const std::string& zone, int32_t vlan_tag) override {
    Record("CreateVNet", vnet + " " + zone + " " + std::to_string(vlan_tag));
  }

  void CreateSubnet(const std::string& vnet, const std::string& cidr, const std::string& gateway, bool snat,
                    const std::string& dhcp_range) override {
    Record("CreateSubnet", vnet + " " + cidr + " " + gateway + (snat ? " snat" : ""));
    last_dhcp_range = dhcp_range;
  }

  void DeleteSubnet(const std::string& vnet, const std::string& cidr) override {
    Record("DeleteSubnet", vnet + " " + cidr);
  }

  void DeleteVNet(const std::string& vnet) override {
    Record("DeleteVNet", vnet);
  }

  void DeleteZone(const std::string& zone) override {
    Record("DeleteZone", zone);
  }

  void ApplyConfig() override {
    Record("ApplyConfig", "");
  }

  std::vector<v1::Container> ListContainers() override {
    if (fail_methods.count("ListContainers") != 0) {
      throw util::ProvisioningError("ListContainers failed");
    }

    std::vector<v1::Container> out;
    for (const auto& [_, container] : containers) {
      out.push_back(container);
    }
    return out;
  }

  std::optional<v1::Container> GetContainer(int32_t vmid) override {
    if (fail_methods.count("GetContainer") != 0) {
      throw util::ProvisioningError("GetContainer failed");
    }

    auto it = containers.find(vmid);
    if (it == containers.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  int32_t NextVMID() override {
    if (fail_methods.count("NextVMID") != 0) {
      throw util::ProvisioningError("NextVMID failed");
    }
    return next_vmid;
  }

  void AddContainer(int32_t vmid, const std::string& name, const std::string& status, int64_t mem, int64_t maxmem) {
    v1::Container container;
    container.set_vmid(vmid);
    container.set_name(name);
    container.set_status(status);
    container.set_mem(mem);
    container.set_maxmem(maxmem);
    containers[vmid] = container;
  }

  // Method names only, in call order.
  std::vector<std::string> Methods() const {
    std::vector<std::string> out;
    for (const auto& call : calls) {
      out.push_back(call.substr(0, call.find(' ')));
    }
    return out;
  }

  bool Called(const std::string& method) const {
    const auto methods = Methods();
    return std::find(methods.begin(), methods.end(), method) != methods.end();
  }

  std::vector<std::string>         calls;
  std::set<std::string>            fail_methods;
  std::map<int32_t, v1::Container> containers;
  std::string                      last_dhcp_range;
  int32_t                          next_vmid{100};

  // Runs before a network call is recorded.
  std::function<void(const std::string& method)> before_call;

 private:
  void Record(const std::string& method, const std::string& args) {
    if (before_call) {
      before_call(method);
    }
    calls.push_back(args.empty() ? method : method + " " + args);
    if (fail_methods.count(method) != 0) {
      throw util::ProvisioningError(method + " failed");
    }
  }
};

} // namespace proxicloud::testing
