#include "deployment_service.hpp"

#include "internal/production/production_service.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace sandbox::service {

using namespace sandbox::orchestrator::v1;

namespace {

void RequireProjectId(const std::string& project_id) {
  if (project_id.empty()) {
    throw util::InvalidArgument("project_id is required");
  }
}

} // namespace

DeploymentService::DeploymentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ProductionJobResponse DeploymentService::Deploy(const DeployRequest& req) {
  return ObserveRpc("ProductionService.Deploy", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    const auto enqueued = ctx_.production->Deploy(req.project_id());
    const auto project  = ctx_.projects->Require(req.project_id());

    ProductionJobResponse resp;
    *resp.mutable_job() = ToProto(enqueued.job);
    resp.set_status(ToProto(project.production_status));
    return resp;
  });
}

ProductionJobResponse DeploymentService::Stop(const StopProductionRequest& req) {
  return ObserveRpc("ProductionService.Stop", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    const auto enqueued = ctx_.production->Stop(req.project_id());
    const auto project  = ctx_.projects->Require(req.project_id());

    ProductionJobResponse resp;
    *resp.mutable_job() = ToProto(enqueued.job);
    resp.set_status(ToProto(project.production_status));
    return resp;
  });
}

RollbackResponse DeploymentService::Rollback(const RollbackRequest& req) {
  return ObserveRpc("ProductionService.Rollback", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    if (req.target_hash().empty()) {
      throw util::InvalidArgument("target_hash is required");
    }

    const auto result = ctx_.production->Rollback(req.project_id(), req.target_hash());

    RollbackResponse resp;
    resp.set_production_hash(result.hash);
    resp.set_production_port(result.port);
    resp.set_production_url(result.url);
    for (const auto& removed : result.removed_versions) {
      resp.add_removed_versions(removed);
    }
    return resp;
  });
}

ListVersionsResponse DeploymentService::ListVersions(const ListVersionsRequest& req) {
  return ObserveRpc("ProductionService.ListVersions", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    ListVersionsResponse resp;
    for (const auto& version : ctx_.production->ListVersions(req.project_id())) {
      *resp.add_versions() = ToProto(version);
    }
    return resp;
  });
}

ProductionStatusResponse DeploymentService::GetProductionStatus(const GetProductionStatusRequest& req) {
  return ObserveRpc("ProductionService.GetProductionStatus", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    const auto view = ctx_.production->GetStatus(req.project_id());

    ProductionStatusResponse resp;
    resp.set_status(ToProto(view.project.production_status));
    resp.set_production_hash(view.project.production_hash);
    resp.set_production_port(view.project.production_port);
    resp.set_production_url(view.project.production_url);
    resp.set_production_error(view.project.production_error);
    resp.set_production_started_at_ms(view.project.production_started_at_ms);
    if (view.active_job) {
      *resp.mutable_active_job() = ToProto(*view.active_job);
    }
    return resp;
  });
}

} // namespace sandbox::service
