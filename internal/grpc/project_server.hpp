#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "admin_auth.hpp"
#include "internal/service/project_service.hpp"
#include "sandbox/orchestrator/v1.hpp"

namespace sandbox::grpc {

// RegisterProject binds a host directory, so it is an admin call.
class ProjectServer final : public sandbox::orchestrator::v1::SandboxProjectService::Service {
public:
  ProjectServer(std::shared_ptr<sandbox::service::ProjectService> svc, std::shared_ptr<AdminAuth> auth);

  ::grpc::Status RegisterProject(::grpc::ServerContext*,
                                 const sandbox::orchestrator::v1::RegisterProjectRequest*,
                                 sandbox::orchestrator::v1::Project*) override;

  ::grpc::Status GetProject(::grpc::ServerContext*,
                            const sandbox::orchestrator::v1::GetProjectRequest*,
                            sandbox::orchestrator::v1::Project*) override;

private:
  std::shared_ptr<sandbox::service::ProjectService> service_;
  std::shared_ptr<AdminAuth>                        auth_;
};

} // namespace sandbox::grpc
