#include "presence_server.hpp"

#include "grpc_error.hpp"

namespace sandbox::grpc {

PresenceServer::PresenceServer(std::shared_ptr<sandbox::service::PresenceService> svc) : service_(std::move(svc)) {}

::grpc::Status PresenceServer::Heartbeat(::grpc::ServerContext*,
                                         const sandbox::orchestrator::v1::HeartbeatRequest* req,
                                         sandbox::orchestrator::v1::HeartbeatResponse* resp) {
  try {
    *resp = service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sandbox::grpc
