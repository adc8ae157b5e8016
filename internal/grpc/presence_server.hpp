#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/presence_service.hpp"
#include "sandbox/orchestrator/v1.hpp"

namespace sandbox::grpc {

class PresenceServer final : public sandbox::orchestrator::v1::SandboxPresenceService::Service {
public:
  explicit PresenceServer(std::shared_ptr<sandbox::service::PresenceService> svc);

  ::grpc::Status Heartbeat(::grpc::ServerContext*,
                           const sandbox::orchestrator::v1::HeartbeatRequest*,
                           sandbox::orchestrator::v1::HeartbeatResponse*) override;

private:
  std::shared_ptr<sandbox::service::PresenceService> service_;
};

} // namespace sandbox::grpc
