#pragma once

#include <memory>
#include <string>

#include "internal/production/production_service.hpp"
#include "internal/queue/handler_registry.hpp"

namespace sandbox::handlers {

/*
  Production deployment jobs.

    production.build -> production.start -> production.waitReady
    production.stop

  Precondition failures (the deployment was stopped or replaced, the
  release vanished) end the job permanently. Other errors retry; when
  the last attempt fails the deployment is marked failed and the
  previous release is restored where one exists.
  Cancellation checkpoint: once per run, before the first side effect,
  so a cancelled waitReady stops at its next poll.
*/
class ProductionJobHandlers {
 public:
  explicit ProductionJobHandlers(std::shared_ptr<production::ProductionService> production);

  static void Register(const std::shared_ptr<ProductionJobHandlers>& self, queue::HandlerRegistry& registry);

  void Build(queue::JobContext& ctx);
  void Start(queue::JobContext& ctx);
  void WaitReady(queue::JobContext& ctx);
  void Stop(queue::JobContext& ctx);

 private:
  // Records a failure without rollback; a missing project is only logged.
  void FailIfTracked(const std::string& project_id, const std::string& error);

  std::shared_ptr<production::ProductionService> production_;
};

} // namespace sandbox::handlers
