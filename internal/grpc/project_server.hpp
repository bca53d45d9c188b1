#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "proxicloud/v1/project_service.grpc.pb.h"
#include "internal/service/project_service.hpp"

namespace proxicloud::grpc {

class ProjectServer final : public proxicloud::v1::ProjectService::Service {
public:
  explicit ProjectServer(std::shared_ptr<proxicloud::service::ProjectService> svc);

  ::grpc::Status ListProjects(::grpc::ServerContext*,
                              const proxicloud::v1::ListProjectsRequest*,
                              proxicloud::v1::ListProjectsResponse*) override;

  ::grpc::Status GetProject(::grpc::ServerContext*,
                            const proxicloud::v1::GetProjectRequest*,
                            proxicloud::v1::GetProjectResponse*) override;

  ::grpc::Status CreateProject(::grpc::ServerContext*,
                               const proxicloud::v1::CreateProjectRequest*,
                               proxicloud::v1::CreateProjectResponse*) override;

  ::grpc::Status UpdateProject(::grpc::ServerContext*,
                               const proxicloud::v1::UpdateProjectRequest*,
                               proxicloud::v1::UpdateProjectResponse*) override;

  ::grpc::Status DeleteProject(::grpc::ServerContext*,
                               const proxicloud::v1::DeleteProjectRequest*,
                               google::protobuf::Empty*) override;

  ::grpc::Status GetProjectContainers(::grpc::ServerContext*,
                                      const proxicloud::v1::GetProjectContainersRequest*,
                                      proxicloud::v1::GetProjectContainersResponse*) override;

  ::grpc::Status AssignContainer(::grpc::ServerContext*,
                                 const proxicloud::v1::AssignContainerRequest*,
                                 google::protobuf::Empty*) override;

  ::grpc::Status ReserveContainerID(::grpc::ServerContext*,
                                    const proxicloud::v1::ReserveContainerIDRequest*,
                                    proxicloud::v1::ReserveContainerIDResponse*) override;

private:
  std::shared_ptr<proxicloud::service::ProjectService> service_;
};

}
