#pragma once

#include <memory>
#include <string>

#include "internal/project/project_store.hpp"
#include "internal/proxmox/container_api.hpp"
#include "internal/proxmox/network_api.hpp"
#include "proxicloud/v1/project.pb.h"

namespace proxicloud::provision {

/*
  Create / delete workflow for projects with a dedicated SDN network.

  Create (request carries network.subnet):
      validate -> zone -> vnet -> dhcp range -> subnet -> apply -> persist
  Any failing step compensates the resources created before it. A failed
  apply is only a warning; a failed persist rolls the network back and
  re-applies.

  Delete:
      drop stale assignments -> refuse if live containers remain ->
      subnet / vnet / zone teardown (best effort) -> apply -> remove entity

  External calls are strictly sequential and run on the caller's thread.
*/
class ProvisioningOrchestrator {
 public:
  struct Options {
    std::string zone_type{"simple"};
  };

  ProvisioningOrchestrator(std::shared_ptr<project::ProjectStore> store, std::shared_ptr<proxmox::NetworkApi> network,
                           std::shared_ptr<proxmox::ContainerApi> containers, Options options);

  proxicloud::v1::Project CreateProject(const proxicloud::v1::CreateProjectRequest& req);
  proxicloud::v1::Project CreateProjectWithID(const std::string& id, const proxicloud::v1::CreateProjectRequest& req);

  void DeleteProject(const std::string& id);

 private:
  void ReleaseStaleAssignments(const proxicloud::v1::Project& project);
  void TeardownNetwork(const proxicloud::v1::Project& project);

  std::shared_ptr<project::ProjectStore>  store_;
  std::shared_ptr<proxmox::NetworkApi>    network_;
  std::shared_ptr<proxmox::ContainerApi>  containers_;
  Options                                 options_;
};

} // namespace proxicloud::provision
