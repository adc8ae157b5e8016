#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/deployment_service.hpp"
#include "sandbox/orchestrator/v1.hpp"

namespace sandbox::grpc {

class ProductionServer final : public sandbox::orchestrator::v1::SandboxProductionService::Service {
public:
  explicit ProductionServer(std::shared_ptr<sandbox::service::DeploymentService> svc);

  ::grpc::Status Deploy(::grpc::ServerContext*,
                        const sandbox::orchestrator::v1::DeployRequest*,
                        sandbox::orchestrator::v1::ProductionJobResponse*) override;

  ::grpc::Status Stop(::grpc::ServerContext*,
                      const sandbox::orchestrator::v1::StopProductionRequest*,
                      sandbox::orchestrator::v1::ProductionJobResponse*) override;

  ::grpc::Status Rollback(::grpc::ServerContext*,
                          const sandbox::orchestrator::v1::RollbackRequest*,
                          sandbox::orchestrator::v1::RollbackResponse*) override;

  ::grpc::Status ListVersions(::grpc::ServerContext*,
                              const sandbox::orchestrator::v1::ListVersionsRequest*,
                              sandbox::orchestrator::v1::ListVersionsResponse*) override;

  ::grpc::Status GetProductionStatus(::grpc::ServerContext*,
                                     const sandbox::orchestrator::v1::GetProductionStatusRequest*,
                                     sandbox::orchestrator::v1::ProductionStatusResponse*) override;

private:
  std::shared_ptr<sandbox::service::DeploymentService> service_;
};

} // namespace sandbox::grpc
