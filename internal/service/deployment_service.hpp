#pragma once

#include "sandbox/orchestrator/v1.hpp"
#include "service_context.hpp"

namespace sandbox::service {

/*
  Production deployment RPCs. Deploy and Stop only validate and enqueue;
  Rollback runs synchronously under the project's deployment lock.
*/
class DeploymentService {
public:
  explicit DeploymentService(ServiceContext ctx);

  sandbox::orchestrator::v1::ProductionJobResponse Deploy(const sandbox::orchestrator::v1::DeployRequest& req);

  sandbox::orchestrator::v1::ProductionJobResponse Stop(const sandbox::orchestrator::v1::StopProductionRequest& req);

  sandbox::orchestrator::v1::RollbackResponse Rollback(const sandbox::orchestrator::v1::RollbackRequest& req);

  sandbox::orchestrator::v1::ListVersionsResponse ListVersions(const sandbox::orchestrator::v1::ListVersionsRequest& req);

  sandbox::orchestrator::v1::ProductionStatusResponse
  GetProductionStatus(const sandbox::orchestrator::v1::GetProductionStatusRequest& req);

private:
  ServiceContext ctx_;
};

}
