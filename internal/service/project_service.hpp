#pragma once

#include "proxicloud/v1/project_service.pb.h"
#include "service_context.hpp"

namespace proxicloud::service {

/*
  Project RPC semantics, independent of the transport.

  Every call is traced and counted; domain errors propagate as exceptions and
  are mapped to status codes by the gRPC adapter.
*/
class ProjectService {
public:
  explicit ProjectService(ServiceContext ctx);

  proxicloud::v1::ListProjectsResponse
  ListProjects(const proxicloud::v1::ListProjectsRequest& req);

  proxicloud::v1::GetProjectResponse
  GetProject(const proxicloud::v1::GetProjectRequest& req);

  proxicloud::v1::CreateProjectResponse
  CreateProject(const proxicloud::v1::CreateProjectRequest& req);

  proxicloud::v1::UpdateProjectResponse
  UpdateProject(const proxicloud::v1::UpdateProjectRequest& req);

  void DeleteProject(const proxicloud::v1::DeleteProjectRequest& req);

  proxicloud::v1::GetProjectContainersResponse
  GetProjectContainers(const proxicloud::v1::GetProjectContainersRequest& req);

  void AssignContainer(const proxicloud::v1::AssignContainerRequest& req);

  proxicloud::v1::ReserveContainerIDResponse
  ReserveContainerID(const proxicloud::v1::ReserveContainerIDRequest& req);

private:
  int32_t PickFreeVMID(const proxicloud::v1::Project& project);

  ServiceContext ctx_;
};

}
