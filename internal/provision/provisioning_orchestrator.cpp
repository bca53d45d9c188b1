#include "provisioning_orchestrator.hpp"

#include <unordered_set>
#include <utility>

#include "internal/network/network_math.hpp"
#include "internal/observability/logging.hpp"
#include "internal/provision/saga.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/random_id.hpp"

namespace proxicloud::provision {

using namespace proxicloud::v1;
using proxicloud::observability::BoolField;
using proxicloud::observability::IntField;
using proxicloud::observability::StringField;
using proxicloud::util::Conflict;
using proxicloud::util::ProvisioningError;
using proxicloud::util::ValidationError;

ProvisioningOrchestrator::ProvisioningOrchestrator(std::shared_ptr<project::ProjectStore> store, std::shared_ptr<proxmox::NetworkApi> network,
                                                   std::shared_ptr<proxmox::ContainerApi> containers, Options options)
    : store_(std::move(store)), network_(std::move(network)), containers_(std::move(containers)), options_(std::move(options)) {
  if (options_.zone_type.empty()) {
    options_.zone_type = "simple";
  }
}

// ------------------------------------------------------------
// Create
// ------------------------------------------------------------

Project ProvisioningOrchestrator::CreateProject(const CreateProjectRequest& req) {
  return CreateProjectWithID(proxicloud::util::NewProjectID(), req);
}

Project ProvisioningOrchestrator::CreateProjectWithID(const std::string& id, const CreateProjectRequest& req) {
  // Name / range / pairing are checked before anything is created remotely.
  store_->ValidateCreate(id, req);

  if (!req.has_network() || req.network().subnet().empty()) {
    CreateProjectRequest plain = req;
    plain.clear_network();

    auto project = store_->CreateProjectWithID(id, plain);
    PROXICLOUD_LOG_INFO("Created project", {StringField("project_id", id), StringField("name", project.name())});
    return project;
  }

  const auto& requested = req.network();

  if (!network::IsValidCIDR(requested.subnet())) {
    throw ValidationError("invalid subnet CIDR: " + requested.subnet() + " (must be a network address, e.g. 10.0.1.0/24)");
  }
  if (requested.gateway().empty()) {
    throw ValidationError("gateway is required when subnet is specified");
  }
  network::ValidateGatewayInSubnet(requested.subnet(), requested.gateway());

  const auto sdn_id = network::GenerateSDNIdentifier(id, req.name());
  const auto zone   = sdn_id;
  const auto vnet   = sdn_id;

  CreateProjectRequest stored = req;
  auto*                net    = stored.mutable_network();
  net->set_vnet_id(vnet);
  net->set_zone(zone);
  net->set_auto_created_zone(true);

  PROXICLOUD_LOG_INFO("Provisioning project network", {StringField("project_id", id), StringField("zone", zone), StringField("vnet", vnet),
                                                      StringField("subnet", requested.subnet()), StringField("gateway", requested.gateway())});

  std::string dhcp_range;
  bool        applied = false;
  Project     project;

  Saga saga("create-project");
  saga.Step("rollback-apply", [] {}, [&] {
        // Only needed once the created resources were committed.
        if (applied) {
          network_->ApplyConfig();
        }
      })
      .Step("zone", [&] { network_->CreateZone(zone, options_.zone_type, {}, true); }, [&] { network_->DeleteZone(zone); })
      .Step("vnet", [&] { network_->CreateVNet(vnet, zone, requested.vlan_tag()); }, [&] { network_->DeleteVNet(vnet); })
      .Step("dhcp-range", [&] { dhcp_range = network::CalculateDHCPRange(requested.subnet(), requested.gateway()); })
      .Step("subnet", [&] { network_->CreateSubnet(vnet, requested.subnet(), requested.gateway(), true, dhcp_range); },
            [&] { network_->DeleteSubnet(vnet, requested.subnet()); })
      .Step("apply", [&] {
        applied = RunBestEffort("apply SDN configuration", [&] { network_->ApplyConfig(); });
        if (!applied) {
          PROXICLOUD_LOG_WARN("SDN configuration not applied; apply it manually in Proxmox", {StringField("zone", zone)});
        }
      })
      .Step("persist", [&] { project = store_->CreateProjectWithID(id, stored); });

  saga.Run();

  PROXICLOUD_LOG_INFO("Created project", {StringField("project_id", id), StringField("name", project.name()), StringField("vnet", vnet),
                                          StringField("dhcp_range", dhcp_range), BoolField("applied", applied)});
  return project;
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

void ProvisioningOrchestrator::ReleaseStaleAssignments(const Project& project) {
  const auto assigned = store_->GetProjectContainers(project.id());
  if (assigned.empty()) {
    return;
  }

  std::vector<Container> live;
  try {
    live = containers_->ListContainers();
  } catch (const std::exception& e) {
    throw ProvisioningError("cannot verify container state for project '" + project.name() + "': " + e.what());
  }

  std::unordered_set<int32_t> live_ids;
  for (const auto& container : live) {
    live_ids.insert(container.vmid());
  }

  for (auto vmid : assigned) {
    if (live_ids.count(vmid) != 0) {
      continue;
    }
    store_->AssignContainer(vmid, "");
    PROXICLOUD_LOG_INFO("Released stale container assignment", {StringField("project_id", project.id()), IntField("vmid", vmid)});
  }
}

void ProvisioningOrchestrator::TeardownNetwork(const Project& project) {
  const auto& net = project.network();

  PROXICLOUD_LOG_INFO("Tearing down project network",
                      {StringField("project_id", project.id()), StringField("vnet", net.vnet_id()), StringField("zone", net.zone())});

  if (!net.subnet().empty()) {
    RunBestEffort("delete subnet " + net.subnet(), [&] { network_->DeleteSubnet(net.vnet_id(), net.subnet()); });
  }
  RunBestEffort("delete vnet " + net.vnet_id(), [&] { network_->DeleteVNet(net.vnet_id()); });
  if (net.auto_created_zone() && !net.zone().empty()) {
    RunBestEffort("delete zone " + net.zone(), [&] { network_->DeleteZone(net.zone()); });
  }
  RunBestEffort("apply SDN configuration", [&] { network_->ApplyConfig(); });
}

void ProvisioningOrchestrator::DeleteProject(const std::string& id) {
  const auto project = store_->GetProject(id);

  ReleaseStaleAssignments(project);

  const auto remaining = store_->GetProjectContainers(id);
  if (!remaining.empty()) {
    throw Conflict("cannot delete project '" + project.name() + "': " + std::to_string(remaining.size()) +
                   " container(s) still assigned");
  }

  if (project.has_network() && !project.network().vnet_id().empty()) {
    TeardownNetwork(project);
  }

  try {
    store_->DeleteProject(id);
  } catch (const Conflict& ex) {
    // A container was assigned while the network was being torn down.
    PROXICLOUD_LOG_WARN("Project network removed but record kept: container assigned during teardown",
                        {StringField("project_id", id), StringField("vnet", project.network().vnet_id()), StringField("error", ex.what())});
    throw;
  }
  PROXICLOUD_LOG_INFO("Deleted project", {StringField("project_id", id), StringField("name", project.name())});
}

} // namespace proxicloud::provision
