#include "project_server.hpp"
#include "grpc_error.hpp"
#include "proxicloud/v1.hpp"

namespace proxicloud::grpc {

ProjectServer::ProjectServer(std::shared_ptr<proxicloud::service::ProjectService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ProjectServer::ListProjects(::grpc::ServerContext*,
                                           const proxicloud::v1::ListProjectsRequest* req,
                                           proxicloud::v1::ListProjectsResponse* resp) {
  try {
    *resp = service_->ListProjects(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::GetProject(::grpc::ServerContext*,
                                         const proxicloud::v1::GetProjectRequest* req,
                                         proxicloud::v1::GetProjectResponse* resp) {
  try {
    *resp = service_->GetProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::CreateProject(::grpc::ServerContext*,
                                            const proxicloud::v1::CreateProjectRequest* req,
                                            proxicloud::v1::CreateProjectResponse* resp) {
  try {
    *resp = service_->CreateProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::UpdateProject(::grpc::ServerContext*,
                                            const proxicloud::v1::UpdateProjectRequest* req,
                                            proxicloud::v1::UpdateProjectResponse* resp) {
  try {
    *resp = service_->UpdateProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::DeleteProject(::grpc::ServerContext*,
                                            const proxicloud::v1::DeleteProjectRequest* req,
                                            google::protobuf::Empty*) {
  try {
    service_->DeleteProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::GetProjectContainers(::grpc::ServerContext*,
                                                   const proxicloud::v1::GetProjectContainersRequest* req,
                                                   proxicloud::v1::GetProjectContainersResponse* resp) {
  try {
    *resp = service_->GetProjectContainers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::AssignContainer(::grpc::ServerContext*,
                                              const proxicloud::v1::AssignContainerRequest* req,
                                              google::protobuf::Empty*) {
  try {
    service_->AssignContainer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::ReserveContainerID(::grpc::ServerContext*,
                                                 const proxicloud::v1::ReserveContainerIDRequest* req,
                                                 proxicloud::v1::ReserveContainerIDResponse* resp) {
  try {
    *resp = service_->ReserveContainerID(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
