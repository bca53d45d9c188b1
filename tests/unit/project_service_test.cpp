#include "internal/service/project_service.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/project/project_store.hpp"
#include "internal/provision/provisioning_orchestrator.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_proxmox.hpp"

namespace {

using namespace proxicloud::v1;
using proxicloud::project::ProjectStore;
using proxicloud::provision::ProvisioningOrchestrator;
using proxicloud::service::ProjectService;
using proxicloud::service::ServiceContext;
using proxicloud::testing::FakeProxmox;
using proxicloud::util::Conflict;
using proxicloud::util::NotFound;
using proxicloud::util::ValidationError;

constexpr int64_t kMiB = 1024 * 1024;

struct Fixture {
  explicit Fixture(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "proxicloud_project_service_tests" / name;
    std::filesystem::remove_all(dir);

    proxmox = std::make_shared<FakeProxmox>();
    store   = std::make_shared<ProjectStore>(dir / "projects.json");

    ServiceContext ctx;
    ctx.store        = store;
    ctx.containers   = proxmox;
    ctx.orchestrator = std::make_shared<ProvisioningOrchestrator>(store, proxmox, proxmox, ProvisioningOrchestrator::Options{});
    service          = std::make_unique<ProjectService>(ctx);
  }

  std::shared_ptr<FakeProxmox>    proxmox;
  std::shared_ptr<ProjectStore>   store;
  std::unique_ptr<ProjectService> service;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

Project CreateRanged(Fixture& f, const std::string& name, int32_t start, int32_t end) {
  CreateProjectRequest req;
  req.set_name(name);
  req.set_container_id_start(start);
  req.set_container_id_end(end);
  return f.service->CreateProject(req).project();
}

void TestCrudRoundTrip() {
  Fixture f("crud");

  CreateProjectRequest create;
  create.set_name("web");
  create.set_description("frontend");
  create.mutable_network()->set_subnet("10.0.1.0/24");
  create.mutable_network()->set_gateway("10.0.1.1");
  const auto created = f.service->CreateProject(create).project();
  assert(!created.network().vnet_id().empty());

  GetProjectRequest get;
  get.set_id(created.id());
  assert(f.service->GetProject(get).project().description() == "frontend");

  UpdateProjectRequest update;
  update.set_id(created.id());
  update.set_description("public frontend");
  update.mutable_network()->set_nameserver("9.9.9.9");
  const auto updated = f.service->UpdateProject(update).project();
  assert(updated.description() == "public frontend");
  assert(updated.network().nameserver() == "9.9.9.9");

  assert(f.service->ListProjects(ListProjectsRequest{}).projects_size() == 1);

  DeleteProjectRequest del;
  del.set_id(created.id());
  f.service->DeleteProject(del);
  assert(f.service->ListProjects(ListProjectsRequest{}).projects_size() == 0);
  assert(Throws<NotFound>([&] { f.service->GetProject(get); }));
}

void TestContainersAndAggregate() {
  Fixture f("aggregate");
  const auto web   = CreateRanged(f, "web", 100, 199);
  const auto other = CreateRanged(f, "other", 200, 299);

  f.proxmox->AddContainer(101, "web-1", "running", 512 * kMiB, 1024 * kMiB);
  f.proxmox->AddContainer(102, "web-2", "stopped", 0, 2048 * kMiB);
  f.proxmox->AddContainer(103, "web-3", "paused", 100 * kMiB, 512 * kMiB);
  f.proxmox->AddContainer(201, "other-1", "running", 64 * kMiB, 128 * kMiB);
  f.proxmox->AddContainer(150, "unassigned", "running", kMiB, kMiB);

  f.store->AssignContainer(101, web.id());
  f.store->AssignContainer(102, web.id());
  f.store->AssignContainer(103, web.id());
  f.store->AssignContainer(201, other.id());
  // Assigned but gone from the node: not reported.
  f.store->AssignContainer(104, web.id());

  GetProjectContainersRequest req;
  req.set_id(web.id());
  const auto resp = f.service->GetProjectContainers(req);

  assert(resp.project().name() == "web");
  assert(resp.containers_size() == 3);
  for (const auto& container : resp.containers()) {
    assert(container.project_id() == web.id());
  }

  const auto& agg = resp.aggregate();
  assert(agg.total_containers() == 3);
  assert(agg.running() == 1);
  assert(agg.stopped() == 2);
  assert(agg.total_memory_mb() == 1024 + 2048 + 512);
  assert(agg.used_memory_mb() == 512 + 100);
}

void TestContainersOfEmptyProject() {
  Fixture f("aggregate_empty");
  const auto web = CreateRanged(f, "web", 100, 199);
  f.proxmox->AddContainer(101, "stray", "running", kMiB, kMiB);

  GetProjectContainersRequest req;
  req.set_id(web.id());
  const auto resp = f.service->GetProjectContainers(req);
  assert(resp.containers_size() == 0);
  assert(resp.aggregate().total_containers() == 0);
  assert(resp.aggregate().total_memory_mb() == 0);

  req.set_id("missing");
  assert(Throws<NotFound>([&] { f.service->GetProjectContainers(req); }));
}

void TestAssignContainer() {
  Fixture f("assign");
  const auto web = CreateRanged(f, "web", 100, 199);
  f.proxmox->AddContainer(101, "web-1", "running", 0, 0);

  AssignContainerRequest req;
  req.set_vmid(101);
  req.set_project_id(web.id());
  f.service->AssignContainer(req);
  assert(f.store->GetContainerProject(101) == web.id());

  req.set_project_id("");
  f.service->AssignContainer(req);
  assert(f.store->GetContainerProject(101).empty());

  req.set_vmid(999);
  req.set_project_id(web.id());
  assert(Throws<NotFound>([&] { f.service->AssignContainer(req); }));

  req.set_vmid(0);
  assert(Throws<ValidationError>([&] { f.service->AssignContainer(req); }));

  req.set_vmid(101);
  req.set_project_id("missing");
  assert(Throws<NotFound>([&] { f.service->AssignContainer(req); }));
}

void TestReserveNextFreeID() {
  Fixture f("reserve_next");

  CreateProjectRequest create;
  create.set_name("web");
  create.set_container_id_start(100);
  create.set_container_id_end(102);
  create.mutable_network()->set_subnet("10.0.1.0/24");
  create.mutable_network()->set_gateway("10.0.1.1");
  create.mutable_network()->set_nameserver("1.1.1.1");
  const auto web = f.service->CreateProject(create).project();

  f.store->AssignContainer(100, web.id());

  ReserveContainerIDRequest req;
  req.set_project_id(web.id());
  const auto resp = f.service->ReserveContainerID(req);
  assert(resp.vmid() == 101);
  assert(resp.vnet_id() == web.network().vnet_id());
  assert(resp.gateway() == "10.0.1.1");
  assert(resp.nameserver() == "1.1.1.1");

  f.store->AssignContainer(101, web.id());
  f.store->AssignContainer(102, web.id());
  assert(Throws<NotFound>([&] { f.service->ReserveContainerID(req); }));
}

void TestReserveRequestedID() {
  Fixture f("reserve_requested");
  const auto web = CreateRanged(f, "web", 100, 199);
  f.proxmox->AddContainer(150, "taken", "running", 0, 0);

  ReserveContainerIDRequest req;
  req.set_project_id(web.id());

  req.set_vmid(120);
  const auto resp = f.service->ReserveContainerID(req);
  assert(resp.vmid() == 120);
  assert(resp.vnet_id().empty());

  req.set_vmid(150);
  assert(Throws<Conflict>([&] { f.service->ReserveContainerID(req); }));

  req.set_vmid(250);
  assert(Throws<ValidationError>([&] { f.service->ReserveContainerID(req); }));

  req.set_project_id("missing");
  assert(Throws<NotFound>([&] { f.service->ReserveContainerID(req); }));
}

void TestReserveWithoutRange() {
  Fixture f("reserve_unranged");

  CreateProjectRequest create;
  create.set_name("free");
  const auto project = f.service->CreateProject(create).project();

  // Any free VMID is accepted when no range is configured.
  ReserveContainerIDRequest req;
  req.set_project_id(project.id());
  req.set_vmid(5000);
  assert(f.service->ReserveContainerID(req).vmid() == 5000);

  // Without a request the cluster's next ID is used.
  f.proxmox->next_vmid = 4242;
  req.clear_vmid();
  assert(f.service->ReserveContainerID(req).vmid() == 4242);

  f.proxmox->fail_methods.insert("NextVMID");
  assert(Throws<proxicloud::util::ProvisioningError>([&] { f.service->ReserveContainerID(req); }));
}

void TestReserveSkipsTakenIDs() {
  Fixture f("reserve_skips_taken");
  const auto web   = CreateRanged(f, "web", 100, 104);
  const auto other = CreateRanged(f, "other", 200, 299);

  // 100: live and assigned elsewhere. 101: live, unassigned.
  // 102: assigned elsewhere, not on the node.
  f.proxmox->AddContainer(100, "other-1", "running", 0, 0);
  f.store->AssignContainer(100, other.id());
  f.proxmox->AddContainer(101, "stray", "stopped", 0, 0);
  f.store->AssignContainer(102, other.id());

  ReserveContainerIDRequest req;
  req.set_project_id(web.id());
  const auto vmid = f.service->ReserveContainerID(req).vmid();
  assert(vmid == 103);
  assert(!f.proxmox->GetContainer(vmid));

  f.proxmox->AddContainer(103, "web-3", "running", 0, 0);
  f.proxmox->AddContainer(104, "web-4", "running", 0, 0);
  assert(Throws<NotFound>([&] { f.service->ReserveContainerID(req); }));

  f.proxmox->fail_methods.insert("ListContainers");
  assert(Throws<proxicloud::util::ProvisioningError>([&] { f.service->ReserveContainerID(req); }));
}

} // namespace

int main() {
  TestCrudRoundTrip();
  TestContainersAndAggregate();
  TestContainersOfEmptyProject();
  TestAssignContainer();
  TestReserveNextFreeID();
  TestReserveRequestedID();
  TestReserveWithoutRange();
  TestReserveSkipsTakenIDs();

  std::cout << "proxicloud_unit_project_service: pass\n";
  return 0;
}
