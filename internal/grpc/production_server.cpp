#include "production_server.hpp"

#include "grpc_error.hpp"

namespace sandbox::grpc {

using namespace sandbox::orchestrator::v1;

ProductionServer::ProductionServer(std::shared_ptr<sandbox::service::DeploymentService> svc) : service_(std::move(svc)) {}

::grpc::Status ProductionServer::Deploy(::grpc::ServerContext*, const DeployRequest* req, ProductionJobResponse* resp) {
  try {
    *resp = service_->Deploy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProductionServer::Stop(::grpc::ServerContext*, const StopProductionRequest* req, ProductionJobResponse* resp) {
  try {
    *resp = service_->Stop(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProductionServer::Rollback(::grpc::ServerContext*, const RollbackRequest* req, RollbackResponse* resp) {
  try {
    *resp = service_->Rollback(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProductionServer::ListVersions(::grpc::ServerContext*, const ListVersionsRequest* req,
                                              ListVersionsResponse* resp) {
  try {
    *resp = service_->ListVersions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProductionServer::GetProductionStatus(::grpc::ServerContext*, const GetProductionStatusRequest* req,
                                                     ProductionStatusResponse* resp) {
  try {
    *resp = service_->GetProductionStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sandbox::grpc
