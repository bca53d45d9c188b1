#include "internal/proxmox/proxmox_client.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using proxicloud::proxmox::ParseContainerList;
using proxicloud::proxmox::ParseDataEnvelope;
using proxicloud::proxmox::ParseNextVMID;
using proxicloud::proxmox::ProxmoxClient;
using proxicloud::util::ProvisioningError;

void TestBaseUrl() {
  assert(ProxmoxClient::BuildBaseUrl("pve.lab") == "https://pve.lab:8006/api2/json");
  assert(ProxmoxClient::BuildBaseUrl("10.0.0.2") == "https://10.0.0.2:8006/api2/json");
  assert(ProxmoxClient::BuildBaseUrl("https://pve.lab:8006") == "https://pve.lab:8006/api2/json");
  assert(ProxmoxClient::BuildBaseUrl("https://pve.lab:8006/") == "https://pve.lab:8006/api2/json");
  assert(ProxmoxClient::BuildBaseUrl("http://localhost:9000//") == "http://localhost:9000/api2/json");

  proxicloud::runtime::config::ProxmoxConfig config;
  config.set_host("pve.lab");
  config.set_node("pve1");
  ProxmoxClient client(config);
  assert(client.BaseUrl() == "https://pve.lab:8006/api2/json");
}

void TestDataEnvelope() {
  const auto data = ParseDataEnvelope(R"({"data": {"digest": "abc"}, "success": 1})");
  assert(data.has_struct_value());
  assert(data.struct_value().fields().at("digest").string_value() == "abc");

  // Mutations reply {"data": null}.
  assert(ParseDataEnvelope(R"({"data": null})").kind_case() == google::protobuf::Value::kNullValue);
  assert(ParseDataEnvelope("{}").kind_case() == google::protobuf::Value::kNullValue);

  bool threw = false;
  try {
    ParseDataEnvelope("<html>502 Bad Gateway</html>");
  } catch (const ProvisioningError&) {
    threw = true;
  }
  assert(threw);
}

void TestContainerList() {
  const auto data = ParseDataEnvelope(R"({"data": [
    {"vmid": 101, "name": "web-1", "status": "running", "mem": 536870912, "maxmem": 1073741824},
    {"vmid": "102", "name": "web-2", "status": "stopped", "maxmem": 2147483648},
    {"name": "no-vmid", "status": "running"},
    "garbage",
    {"vmid": 103}
  ]})");

  const auto containers = ParseContainerList(data);
  assert(containers.size() == 3);

  assert(containers[0].vmid() == 101);
  assert(containers[0].name() == "web-1");
  assert(containers[0].status() == "running");
  assert(containers[0].mem() == 536870912);
  assert(containers[0].maxmem() == 1073741824);

  assert(containers[1].vmid() == 102);
  assert(containers[1].mem() == 0);
  assert(containers[1].maxmem() == 2147483648LL);

  assert(containers[2].vmid() == 103);
  assert(containers[2].status() == "unknown");
  assert(containers[2].project_id().empty());

  assert(ParseContainerList(ParseDataEnvelope(R"({"data": null})")).empty());
  assert(ParseContainerList(ParseDataEnvelope(R"({"data": []})")).empty());
}

void TestNextVMID() {
  assert(ParseNextVMID(ParseDataEnvelope(R"({"data": "105"})")) == 105);
  assert(ParseNextVMID(ParseDataEnvelope(R"({"data": 106})")) == 106);

  for (const char* body : {R"({"data": null})", R"({"data": "abc"})", R"({"data": 0})", R"({"data": {"id": 1}})"}) {
    bool threw = false;
    try {
      ParseNextVMID(ParseDataEnvelope(body));
    } catch (const ProvisioningError&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestBaseUrl();
  TestDataEnvelope();
  TestContainerList();
  TestNextVMID();

  std::cout << "proxicloud_unit_proxmox_client: pass\n";
  return 0;
}
