#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <utility>
#include <vector>

#include "config/config.pb.h"
#include "internal/proxmox/container_api.hpp"
#include "internal/proxmox/network_api.hpp"

namespace proxicloud::proxmox {

// Extracts "data" from a {"data": ...} reply body. Throws ProvisioningError on malformed JSON.
google::protobuf::Value ParseDataEnvelope(const std::string& body);

// Converts /nodes/{node}/lxc entries. vmid is accepted as number or string.
std::vector<proxicloud::v1::Container> ParseContainerList(const google::protobuf::Value& data);
proxicloud::v1::Container              ParseContainer(const google::protobuf::Struct& entry);

// /cluster/nextid replies with the ID as a string or a number.
int32_t ParseNextVMID(const google::protobuf::Value& data);

/*
  Proxmox VE REST client (libcurl).

  Base URL:  https://<host>:8006/api2/json, or <host>/api2/json when the
  configured host already carries a scheme.
  Auth:      Authorization: PVEAPIToken=<token_id>=<token_secret>
  Bodies:    application/x-www-form-urlencoded
  Replies:   {"data": ...}, parsed as google.protobuf.Value

  One easy handle per request; the client itself holds no mutable state and
  may be shared between threads.
*/
class ProxmoxClient final : public NetworkApi, public ContainerApi {
 public:
  using FormFields = std::vector<std::pair<std::string, std::string>>;

  struct Response {
    long        status{0};
    std::string body;
  };

  explicit ProxmoxClient(const proxicloud::runtime::config::ProxmoxConfig& config);

  void CreateZone(const std::string& zone, const std::string& type, const ZoneOptions& options, bool dhcp_enabled) override;
  void CreateVNet(const std::string& vnet, const std::string& zone, int32_t vlan_tag) override;
  void CreateSubnet(const std::string& vnet, const std::string& cidr, const std::string& gateway, bool snat,
                    const std::string& dhcp_range) override;

  void DeleteSubnet(const std::string& vnet, const std::string& cidr) override;
  void DeleteVNet(const std::string& vnet) override;
  void DeleteZone(const std::string& zone) override;
  void ApplyConfig() override;

  std::vector<proxicloud::v1::Container>   ListContainers() override;
  std::optional<proxicloud::v1::Container> GetContainer(int32_t vmid) override;
  int32_t                                  NextVMID() override;

  const std::string& BaseUrl() const {
    return base_url_;
  }

  static std::string BuildBaseUrl(const std::string& host);

 private:
  // Performs one HTTP exchange. Throws ProvisioningError on transport failure only.
  Response Perform(const std::string& method, const std::string& path, const FormFields& form) const;

  // Perform + status check; returns the "data" member of the reply.
  google::protobuf::Value Call(const std::string& method, const std::string& path, const FormFields& form = {}) const;

  std::string EncodeForm(const FormFields& form) const;

  std::string base_url_;
  std::string node_;
  std::string auth_header_;
  bool        insecure_{false};
  long        timeout_seconds_{60};
};

} // namespace proxicloud::proxmox
