#include "factory.hpp"

#include <memory>

#include "internal/grpc/project_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/project/project_store.hpp"
#include "internal/provision/provisioning_orchestrator.hpp"
#include "internal/proxmox/proxmox_client.hpp"
#include "internal/service/project_service.hpp"
#include "internal/service/service_context.hpp"

namespace proxicloud::factory {

using namespace proxicloud;

/*
    Build full application dependency graph
*/
Application Build(const proxicloud::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Hypervisor client
  // ------------------------------------------------------------------
  auto client = std::make_shared<proxmox::ProxmoxClient>(config.proxmox());
  PROXICLOUD_LOG_INFO("Proxmox client configured",
                      {observability::StringField("base_url", client->BaseUrl()), observability::StringField("node", config.proxmox().node()),
                       observability::BoolField("insecure", config.proxmox().insecure())});

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.store = std::make_shared<project::ProjectStore>(config.store().path());

  provision::ProvisioningOrchestrator::Options options;
  options.zone_type = config.sdn().zone_type();

  auto orchestrator = std::make_shared<provision::ProvisioningOrchestrator>(app.store, client, client, options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store        = app.store;
  ctx.orchestrator = orchestrator;
  ctx.containers   = client;

  auto project_service = std::make_shared<service::ProjectService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ProjectServer>(project_service));

  return app;
}

} // namespace proxicloud::factory
