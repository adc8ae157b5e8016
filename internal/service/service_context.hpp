#pragma once

#include <memory>

namespace sandbox::queue {
class JobStore;
}
namespace sandbox::projects {
class ProjectStore;
}
namespace sandbox::ports {
class PortAllocator;
}
namespace sandbox::presence {
class PresenceManager;
}
namespace sandbox::production {
class ProductionService;
}

namespace sandbox::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<sandbox::queue::JobStore>                jobs;
  std::shared_ptr<sandbox::projects::ProjectStore>         projects;
  std::shared_ptr<sandbox::ports::PortAllocator>           ports;
  std::shared_ptr<sandbox::presence::PresenceManager>      presence;
  std::shared_ptr<sandbox::production::ProductionService>  production;
};

} // namespace sandbox::service
