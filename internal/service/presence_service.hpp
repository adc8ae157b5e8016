#pragma once

#include "sandbox/orchestrator/v1.hpp"
#include "service_context.hpp"

namespace sandbox::service {

class PresenceService {
public:
  explicit PresenceService(ServiceContext ctx);

  sandbox::orchestrator::v1::HeartbeatResponse Heartbeat(const sandbox::orchestrator::v1::HeartbeatRequest& req);

private:
  ServiceContext ctx_;
};

}
