#pragma once

#include "sandbox/orchestrator/v1.hpp"
#include "service_context.hpp"

namespace sandbox::service {

class ProjectService {
public:
  explicit ProjectService(ServiceContext ctx);

  // Allocates the preview dev and runtime ports and stores the project as created.
  sandbox::orchestrator::v1::Project RegisterProject(const sandbox::orchestrator::v1::RegisterProjectRequest& req);

  sandbox::orchestrator::v1::Project GetProject(const sandbox::orchestrator::v1::GetProjectRequest& req);

private:
  ServiceContext ctx_;
};

}
