#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace sandbox::queue {
class Dispatcher;
class JobStore;
}
namespace sandbox::presence {
class PresenceManager;
}
namespace sandbox::production {
class ProductionService;
}
namespace sandbox::projects {
class ProjectStore;
}

namespace sandbox::factory {

/*
  Application

  Owns every long-lived component of the daemon. The dispatcher and the
  presence reaper are built stopped; the caller starts them once the
  gRPC server is up and stops them before the process exits.
*/
struct Application {
  std::shared_ptr<db::Repository>                         repository;
  std::shared_ptr<sandbox::queue::JobStore>               jobs;
  std::shared_ptr<sandbox::projects::ProjectStore>        projects;
  std::shared_ptr<sandbox::queue::Dispatcher>             dispatcher;
  std::shared_ptr<sandbox::presence::PresenceManager>     presence;
  std::shared_ptr<sandbox::production::ProductionService> production;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// Picks the configured backend and brings its schema up to date.
std::shared_ptr<db::Repository> BuildRepository(const sandbox::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows the concrete repository,
  container runtime, probe and session client types.
*/
Application Build(const sandbox::runtime::config::RuntimeConfig& config);

} // namespace sandbox::factory
