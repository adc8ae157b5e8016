#include "project_server.hpp"

#include "grpc_error.hpp"

namespace sandbox::grpc {

using namespace sandbox::orchestrator::v1;

ProjectServer::ProjectServer(std::shared_ptr<sandbox::service::ProjectService> svc, std::shared_ptr<AdminAuth> auth)
    : service_(std::move(svc)), auth_(std::move(auth)) {}

::grpc::Status ProjectServer::RegisterProject(::grpc::ServerContext* context, const RegisterProjectRequest* req,
                                              Project* resp) {
  try {
    auth_->Require(context);
    *resp = service_->RegisterProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::GetProject(::grpc::ServerContext*, const GetProjectRequest* req, Project* resp) {
  try {
    *resp = service_->GetProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sandbox::grpc
