#include "project_service.hpp"

#include <chrono>
#include <type_traits>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/project/project_store.hpp"
#include "internal/provision/provisioning_orchestrator.hpp"
#include "internal/proxmox/container_api.hpp"
#include "internal/util/errors.hpp"
#include "proxicloud/v1.hpp"

namespace proxicloud::service {

using namespace proxicloud::v1;
using proxicloud::observability::IntField;
using proxicloud::observability::StringField;
using proxicloud::util::Conflict;
using proxicloud::util::NotFound;
using proxicloud::util::ValidationError;

namespace {

constexpr int64_t kBytesPerMB = 1024 * 1024;

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view project_id, Fn&& fn) {
  proxicloud::observability::SpanScope span(route);
  if (!project_id.empty()) {
    span.SetAttribute("project.id", project_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      proxicloud::observability::Metrics::Instance().RecordRequest(route, true);
      proxicloud::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
      return;
    } else {
      auto result = fn();
      proxicloud::observability::Metrics::Instance().RecordRequest(route, true);
      proxicloud::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    PROXICLOUD_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what()), StringField("project_id", project_id)});
    proxicloud::observability::Metrics::Instance().RecordRequest(route, false);
    proxicloud::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

} // namespace

ProjectService::ProjectService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListProjectsResponse ProjectService::ListProjects(const ListProjectsRequest&) {
  return ObserveRpc("ProjectService.ListProjects", {}, [&] {
    ListProjectsResponse resp;
    for (auto& project : ctx_.store->ListProjects()) {
      *resp.add_projects() = std::move(project);
    }
    return resp;
  });
}

GetProjectResponse ProjectService::GetProject(const GetProjectRequest& req) {
  return ObserveRpc("ProjectService.GetProject", req.id(), [&] {
    GetProjectResponse resp;
    *resp.mutable_project() = ctx_.store->GetProject(req.id());
    return resp;
  });
}

CreateProjectResponse ProjectService::CreateProject(const CreateProjectRequest& req) {
  return ObserveRpc("ProjectService.CreateProject", {}, [&] {
    CreateProjectResponse resp;
    *resp.mutable_project() = ctx_.orchestrator->CreateProject(req);
    return resp;
  });
}

UpdateProjectResponse ProjectService::UpdateProject(const UpdateProjectRequest& req) {
  return ObserveRpc("ProjectService.UpdateProject", req.id(), [&] {
    UpdateProjectResponse resp;
    *resp.mutable_project() = ctx_.store->UpdateProject(req.id(), req);
    PROXICLOUD_LOG_INFO("Updated project", {StringField("project_id", req.id()), StringField("name", resp.project().name())});
    return resp;
  });
}

void ProjectService::DeleteProject(const DeleteProjectRequest& req) {
  ObserveRpc("ProjectService.DeleteProject", req.id(), [&] { ctx_.orchestrator->DeleteProject(req.id()); });
}

/*
  Live containers whose VMID is assigned to the project, plus totals.
  Memory figures are reported in MiB.
*/
GetProjectContainersResponse ProjectService::GetProjectContainers(const GetProjectContainersRequest& req) {
  return ObserveRpc("ProjectService.GetProjectContainers", req.id(), [&] {
    GetProjectContainersResponse resp;
    *resp.mutable_project() = ctx_.store->GetProject(req.id());

    auto* aggregate = resp.mutable_aggregate();
    for (auto& container : ctx_.containers->ListContainers()) {
      if (ctx_.store->GetContainerProject(container.vmid()) != req.id()) {
        continue;
      }
      container.set_project_id(req.id());

      aggregate->set_total_containers(aggregate->total_containers() + 1);
      if (container.status() == "running") {
        aggregate->set_running(aggregate->running() + 1);
      } else {
        aggregate->set_stopped(aggregate->stopped() + 1);
      }
      aggregate->set_total_memory_mb(aggregate->total_memory_mb() + container.maxmem() / kBytesPerMB);
      aggregate->set_used_memory_mb(aggregate->used_memory_mb() + container.mem() / kBytesPerMB);

      *resp.add_containers() = std::move(container);
    }
    return resp;
  });
}

void ProjectService::AssignContainer(const AssignContainerRequest& req) {
  ObserveRpc("ProjectService.AssignContainer", req.project_id(), [&] {
    if (req.vmid() <= 0) {
      throw ValidationError("invalid vmid: " + std::to_string(req.vmid()));
    }
    if (!ctx_.containers->GetContainer(req.vmid())) {
      throw NotFound("container not found: " + std::to_string(req.vmid()));
    }

    ctx_.store->AssignContainer(req.vmid(), req.project_id());
    PROXICLOUD_LOG_INFO(req.project_id().empty() ? "Unassigned container" : "Assigned container",
                        {IntField("vmid", req.vmid()), StringField("project_id", req.project_id())});
  });
}

/*
  First VMID in the project's range that is neither assigned to any project
  nor held by a live container. IDs below the store's next candidate are all
  assigned to this project already. Without a range the cluster picks.
*/
int32_t ProjectService::PickFreeVMID(const Project& project) {
  if (!project.has_container_id_start() || !project.has_container_id_end()) {
    return ctx_.containers->NextVMID();
  }

  const auto first = ctx_.store->GetNextContainerIDInRange(project.id());

  std::unordered_set<int32_t> live;
  for (const auto& container : ctx_.containers->ListContainers()) {
    live.insert(container.vmid());
  }

  for (int64_t candidate = first; candidate <= project.container_id_end(); ++candidate) {
    const auto vmid = static_cast<int32_t>(candidate);
    if (live.count(vmid) != 0 || !ctx_.store->GetContainerProject(vmid).empty()) {
      continue;
    }
    return vmid;
  }

  throw NotFound("no free container IDs in range " + std::to_string(project.container_id_start()) + "-" +
                 std::to_string(project.container_id_end()) + " for project '" + project.name() + "'");
}

/*
  Picks the VMID for a new container in the project.

    requested vmid  -> must be inside the project's range and not live
    no vmid         -> PickFreeVMID
*/
ReserveContainerIDResponse ProjectService::ReserveContainerID(const ReserveContainerIDRequest& req) {
  return ObserveRpc("ProjectService.ReserveContainerID", req.project_id(), [&] {
    const auto project = ctx_.store->GetProject(req.project_id());

    int32_t vmid = 0;
    if (req.has_vmid() && req.vmid() > 0) {
      vmid = req.vmid();
      if (project.has_container_id_start() && project.has_container_id_end() &&
          (vmid < project.container_id_start() || vmid > project.container_id_end())) {
        throw ValidationError("VMID " + std::to_string(vmid) + " is outside project's container ID range " +
                              std::to_string(project.container_id_start()) + "-" + std::to_string(project.container_id_end()));
      }
      if (ctx_.containers->GetContainer(vmid)) {
        throw Conflict("VMID " + std::to_string(vmid) + " already in use");
      }
    } else {
      vmid = PickFreeVMID(project);
    }

    ReserveContainerIDResponse resp;
    resp.set_vmid(vmid);
    if (project.has_network()) {
      resp.set_vnet_id(project.network().vnet_id());
      resp.set_gateway(project.network().gateway());
      resp.set_nameserver(project.network().nameserver());
    }
    return resp;
  });
}

}
