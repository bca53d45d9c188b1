#pragma once

#include <memory>

namespace proxicloud::project { class ProjectStore; }
namespace proxicloud::provision { class ProvisioningOrchestrator; }
namespace proxicloud::proxmox { class ContainerApi; }

namespace proxicloud::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<proxicloud::project::ProjectStore> store;
  std::shared_ptr<proxicloud::provision::ProvisioningOrchestrator> orchestrator;
  std::shared_ptr<proxicloud::proxmox::ContainerApi> containers;
};

}
