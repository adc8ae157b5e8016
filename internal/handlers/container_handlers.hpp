#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/external/container_runtime.hpp"
#include "internal/external/health_probe.hpp"
#include "internal/external/session_client.hpp"
#include "internal/projects/project_store.hpp"
#include "internal/queue/handler_registry.hpp"
#include "internal/queue/job_enqueuer.hpp"

namespace sandbox::handlers {

struct ContainerHandlerOptions {
  uint64_t wait_ready_timeout_ms = 300000;
  uint64_t wait_ready_poll_ms    = 1000;
};

/*
  Preview container jobs.

    docker.composeUp  -> docker.waitReady -> session.create
    docker.stop

  A project that is gone or being deleted ends the job successfully.
  Cancellation checkpoints: before touching the engine and again before
  chaining the next job.
*/
class ContainerJobHandlers {
 public:
  ContainerJobHandlers(std::shared_ptr<projects::ProjectStore> projects, std::shared_ptr<queue::JobEnqueuer> enqueuer,
                       std::shared_ptr<external::ContainerRuntime> runtime, std::shared_ptr<external::HealthProbe> probe,
                       std::shared_ptr<external::SessionClient> sessions, ContainerHandlerOptions options = {});

  static void Register(const std::shared_ptr<ContainerJobHandlers>& self, queue::HandlerRegistry& registry);

  void ComposeUp(queue::JobContext& ctx);
  void WaitReady(queue::JobContext& ctx);
  void Stop(queue::JobContext& ctx);
  void CreateSession(queue::JobContext& ctx);

 private:
  // The project the job targets, or nullopt when it should be skipped.
  std::optional<projects::ProjectRecord> LoadTarget(const queue::JobContext& ctx, const std::string& project_id);

  std::shared_ptr<projects::ProjectStore>     projects_;
  std::shared_ptr<queue::JobEnqueuer>         enqueuer_;
  std::shared_ptr<external::ContainerRuntime> runtime_;
  std::shared_ptr<external::HealthProbe>      probe_;
  std::shared_ptr<external::SessionClient>    sessions_;
  ContainerHandlerOptions                     options_;
};

} // namespace sandbox::handlers
