#include "production_service.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/production/content_hash.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::production {

using observability::IntField;
using observability::StringField;
using sandbox::model::ProductionStatus;
using sandbox::model::ProjectStatus;

ProductionOptions ProductionOptions::FromConfig(const sandbox::runtime::config::RuntimeConfig& config) {
  const auto&       p = config.production();
  ProductionOptions options;
  if (!p.root_dir().empty()) options.root_dir = p.root_dir();
  if (p.keep_versions() > 0) options.keep_versions = p.keep_versions();
  if (p.ready_timeout_ms() > 0) options.ready_timeout_ms = p.ready_timeout_ms();
  if (p.ready_probe_interval_ms() > 0) options.ready_probe_interval_ms = p.ready_probe_interval_ms();
  if (!p.public_host().empty()) options.public_host = p.public_host();
  return options;
}

ProductionService::ProductionService(std::shared_ptr<projects::ProjectStore> projects, std::shared_ptr<queue::JobEnqueuer> enqueuer,
                                     std::shared_ptr<ports::PortAllocator> ports, std::shared_ptr<ReleaseStore> releases,
                                     std::shared_ptr<external::ContainerRuntime> runtime, std::shared_ptr<external::HealthProbe> probe,
                                     ProductionOptions options, util::NowFn now)
    : projects_(std::move(projects)),
      enqueuer_(std::move(enqueuer)),
      ports_(std::move(ports)),
      releases_(std::move(releases)),
      runtime_(std::move(runtime)),
      probe_(std::move(probe)),
      options_(std::move(options)),
      now_(std::move(now)) {
}

std::string ProductionService::UrlFor(uint32_t port) const {
  return "http://" + options_.public_host + ":" + std::to_string(port);
}

void ProductionService::TransitionTo(const std::string& project_id, ProductionStatus to, const projects::ProjectStore::Mutator& mutate) {
  ProductionStatus from = ProductionStatus::kStopped;
  projects_->Update(project_id, [&](projects::ProjectRecord& p) {
    from = p.production_status;
    if (from != to && !sandbox::model::CanTransition(from, to)) {
      throw util::InvalidState("production cannot go from " + std::string(sandbox::model::ToString(from)) + " to " +
                               std::string(sandbox::model::ToString(to)));
    }
    p.production_status = to;
    if (mutate) mutate(p);
  });

  SANDBOX_LOG_INFO("production status changed", {StringField("project_id", project_id), StringField("from", sandbox::model::ToString(from)),
                                                 StringField("to", sandbox::model::ToString(to))});
}

void ProductionService::RecordServing(projects::ProjectRecord& p, const std::string& hash, uint32_t port, const std::string& error) const {
  p.production_hash          = hash;
  p.production_port          = port;
  p.production_url           = UrlFor(port);
  p.production_error         = error;
  p.production_started_at_ms = util::NowMillis(now_);
}

void ProductionService::StopContainerQuietly(const std::string& project_id) {
  try {
    runtime_->StopProduction(project_id);
  } catch (const std::exception& e) {
    SANDBOX_LOG_WARN("production container stop failed", {StringField("project_id", project_id), StringField("error", e.what())});
  }
}

void ProductionService::Activate(const std::string& project_id, const std::string& hash, uint32_t port) {
  StopContainerQuietly(project_id);
  releases_->PromoteRelease(project_id, hash);

  external::ProductionContainerSpec spec;
  spec.project_id  = project_id;
  spec.hash        = hash;
  spec.release_dir = releases_->ReleaseDir(project_id, hash);
  spec.host_port   = port;
  runtime_->StartProduction(spec);

  SANDBOX_LOG_INFO("production release active", {StringField("project_id", project_id), StringField("hash", hash), IntField("port", port)});
}

bool ProductionService::RestorePrevious(const std::string& project_id, const std::string& previous_hash, uint32_t port) {
  if (previous_hash.empty() || !releases_->HasRelease(project_id, previous_hash)) return false;

  try {
    Activate(project_id, previous_hash, port);
    return true;
  } catch (const std::exception& e) {
    SANDBOX_LOG_ERROR("production restore failed", {StringField("project_id", project_id), StringField("hash", previous_hash),
                                                    StringField("error", e.what())});
    return false;
  }
}

// ------------------------------------------------------------------
// User actions
// ------------------------------------------------------------------

queue::EnqueueResult ProductionService::Deploy(const std::string& project_id) {
  {
    auto guard = locks_.Acquire(project_id);
    projects_->Update(project_id, [](projects::ProjectRecord& p) {
      if (p.status != ProjectStatus::kRunning) {
        throw util::InvalidState("preview must be running to deploy (status " + std::string(sandbox::model::ToString(p.status)) + ")");
      }
      if (sandbox::model::IsActive(p.production_status)) {
        throw util::InvalidState("a production deployment is already in progress");
      }
      if (!sandbox::model::CanTransition(p.production_status, ProductionStatus::kQueued)) {
        throw util::InvalidState("cannot deploy from " + std::string(sandbox::model::ToString(p.production_status)));
      }
      p.production_status = ProductionStatus::kQueued;
      p.production_error.clear();
    });
  }

  try {
    auto result = enqueuer_->EnqueueProductionBuild(project_id);
    SANDBOX_LOG_INFO("production deploy queued", {StringField("project_id", project_id), StringField("job_id", result.job.id)});
    return result;
  } catch (const std::exception& e) {
    TransitionTo(project_id, ProductionStatus::kFailed, [&](projects::ProjectRecord& p) { p.production_error = e.what(); });
    throw;
  }
}

queue::EnqueueResult ProductionService::Stop(const std::string& project_id) {
  const auto status = projects_->Require(project_id).production_status;
  if (status != ProductionStatus::kRunning) {
    throw util::InvalidState("production is " + std::string(sandbox::model::ToString(status)) + ", not running");
  }
  auto result = enqueuer_->EnqueueProductionStop(project_id);
  SANDBOX_LOG_INFO("production stop queued", {StringField("project_id", project_id), StringField("job_id", result.job.id)});
  return result;
}

RollbackResult ProductionService::Rollback(const std::string& project_id, const std::string& target_hash) {
  auto guard   = locks_.Acquire(project_id);
  auto project = projects_->Require(project_id);

  if (!releases_->HasRelease(project_id, target_hash)) {
    throw util::NotFound("release not found: " + target_hash);
  }
  const auto current = releases_->CurrentHash(project_id);
  if (current && *current == target_hash) {
    throw util::InvalidState("release " + target_hash + " is already active");
  }
  if (project.production_hash.empty()) {
    throw util::InvalidState("project has no production deployment");
  }
  if (project.production_status != ProductionStatus::kRunning) {
    throw util::InvalidState("cannot roll back while production is " + std::string(sandbox::model::ToString(project.production_status)));
  }

  const auto port = project.production_port != 0 ? project.production_port : ports_->AllocateProjectBasePort(project_id);

  SANDBOX_LOG_INFO("production rollback started", {StringField("project_id", project_id), StringField("from", current.value_or("")),
                                                   StringField("to", target_hash)});
  try {
    Activate(project_id, target_hash, port);
  } catch (const std::exception& e) {
    SANDBOX_LOG_ERROR("production rollback failed", {StringField("project_id", project_id), StringField("hash", target_hash),
                                                     StringField("error", e.what())});
    const auto error = std::string("rollback to ") + target_hash + " failed: " + e.what();
    if (current && RestorePrevious(project_id, *current, port)) {
      TransitionTo(project_id, ProductionStatus::kRunning, [&](projects::ProjectRecord& p) { RecordServing(p, *current, port, error); });
    } else {
      TransitionTo(project_id, ProductionStatus::kFailed, [&](projects::ProjectRecord& p) { p.production_error = error; });
    }
    throw;
  }

  TransitionTo(project_id, ProductionStatus::kRunning, [&](projects::ProjectRecord& p) { RecordServing(p, target_hash, port, ""); });
  auto report = releases_->Cleanup(project_id, options_.keep_versions);

  RollbackResult result;
  result.hash             = target_hash;
  result.port             = port;
  result.url              = UrlFor(port);
  result.removed_versions = std::move(report.removed);

  SANDBOX_LOG_INFO("production rolled back", {StringField("project_id", project_id), StringField("hash", target_hash), IntField("port", port)});
  return result;
}

std::vector<ReleaseVersion> ProductionService::ListVersions(const std::string& project_id) {
  projects_->Require(project_id);
  return releases_->ListVersions(project_id);
}

ProductionStatusView ProductionService::GetStatus(const std::string& project_id) {
  ProductionStatusView view;
  view.project = projects_->Require(project_id);

  db::JobFilter filter;
  filter.project_id = project_id;
  db::Pagination all;
  all.limit = 0;
  for (const auto& job : enqueuer_->Store().ListJobs(filter, all)) {
    if (job.type.rfind("production.", 0) == 0 && !sandbox::model::IsTerminal(job.state)) {
      view.active_job = job;
      break;
    }
  }
  return view;
}

bool ProductionService::HasActiveDeployment(const std::string& project_id) {
  return sandbox::model::IsActive(projects_->Require(project_id).production_status);
}

// ------------------------------------------------------------------
// Job steps
// ------------------------------------------------------------------

std::string ProductionService::BuildRelease(const std::string& project_id) {
  TransitionTo(project_id, ProductionStatus::kBuilding);
  const auto project = projects_->Require(project_id);

  SANDBOX_LOG_INFO("production build started", {StringField("project_id", project_id), StringField("path", project.path_on_disk)});
  const auto output = runtime_->BuildProductionBundle(project);
  const auto hash   = ContentHash(output);
  releases_->InstallRelease(project_id, hash, output);
  SANDBOX_LOG_INFO("production build finished", {StringField("project_id", project_id), StringField("hash", hash)});

  enqueuer_->EnqueueProductionStart(project_id, hash);
  return hash;
}

void ProductionService::StartRelease(const std::string& project_id, const std::string& hash) {
  auto guard   = locks_.Acquire(project_id);
  auto project = projects_->Require(project_id);
  if (project.production_status != ProductionStatus::kBuilding) {
    throw util::InvalidState("production is " + std::string(sandbox::model::ToString(project.production_status)) + ", not building");
  }
  if (!releases_->HasRelease(project_id, hash)) {
    throw util::NotFound("release not found: " + hash);
  }

  const auto port         = ports_->AllocateProjectBasePort(project_id);
  const auto version_port = ports_->DeriveVersionPort(project_id, hash);
  if (!ports_->RegisterPort(version_port, db::model::PortType::kVersion, project_id, hash)) {
    SANDBOX_LOG_WARN("version port collision", {StringField("project_id", project_id), StringField("hash", hash), IntField("port", version_port)});
  }

  const auto  current  = releases_->CurrentHash(project_id);
  std::string previous = current && *current != hash ? *current : std::string();

  try {
    Activate(project_id, hash, port);
  } catch (const std::exception& e) {
    SANDBOX_LOG_ERROR("production start failed", {StringField("project_id", project_id), StringField("hash", hash), StringField("error", e.what())});
    RestorePrevious(project_id, previous, port);
    throw;
  }

  const auto now_ms = util::NowMillis(now_);
  projects_->Update(project_id, [&](projects::ProjectRecord& p) {
    p.production_hash          = hash;
    p.production_port          = port;
    p.production_started_at_ms = now_ms;
    p.production_error.clear();
  });

  enqueuer_->EnqueueProductionWaitReady(project_id, hash, previous, port, options_.ready_probe_interval_ms);
  releases_->Cleanup(project_id, options_.keep_versions);
}

ReadyCheck ProductionService::CheckReady(const std::string& project_id, const std::string& hash, const std::string& previous_hash,
                                         uint32_t port, uint64_t started_at_ms) {
  const auto project = projects_->Require(project_id);
  if (project.production_status != ProductionStatus::kBuilding || project.production_hash != hash) {
    SANDBOX_LOG_INFO("production readiness check superseded", {StringField("project_id", project_id), StringField("hash", hash)});
    return ReadyCheck::kSuperseded;
  }

  if (probe_->ProductionReady(port)) {
    const auto url = UrlFor(port);
    TransitionTo(project_id, ProductionStatus::kRunning, [&](projects::ProjectRecord& p) {
      p.production_url = url;
      p.production_error.clear();
    });
    SANDBOX_LOG_INFO("production ready", {StringField("project_id", project_id), StringField("hash", hash), StringField("url", url)});
    return ReadyCheck::kReady;
  }

  const auto now_ms = util::NowMillis(now_);
  if (now_ms >= started_at_ms && now_ms - started_at_ms >= options_.ready_timeout_ms) {
    FailDeployment(project_id, hash, previous_hash,
                   "production not ready after " + std::to_string(options_.ready_timeout_ms / 1000) + "s on port " + std::to_string(port));
    return ReadyCheck::kTimedOut;
  }
  return ReadyCheck::kPending;
}

void ProductionService::FailDeployment(const std::string& project_id, const std::string& failed_hash, const std::string& previous_hash,
                                       const std::string& error) {
  auto guard = locks_.Acquire(project_id);

  const auto status = projects_->Require(project_id).production_status;
  if (status != ProductionStatus::kFailed && !sandbox::model::CanTransition(status, ProductionStatus::kFailed)) {
    SANDBOX_LOG_WARN("production failure not recorded", {StringField("project_id", project_id),
                                                         StringField("status", sandbox::model::ToString(status)), StringField("error", error)});
    return;
  }

  TransitionTo(project_id, ProductionStatus::kFailed, [&](projects::ProjectRecord& p) { p.production_error = error; });
  SANDBOX_LOG_ERROR("production deployment failed", {StringField("project_id", project_id), StringField("hash", failed_hash),
                                                     StringField("error", error)});

  // A failed build never touched `current`.
  if (failed_hash.empty()) return;

  std::string previous = previous_hash;
  if (previous.empty()) {
    previous = releases_->GetPreviousReleaseHash(project_id, failed_hash).value_or("");
  }
  if (previous.empty() || previous == failed_hash) return;

  const auto project = projects_->Require(project_id);
  const auto port    = project.production_port != 0 ? project.production_port : ports_->AllocateProjectBasePort(project_id);
  if (RestorePrevious(project_id, previous, port)) {
    projects_->Update(project_id, [&](projects::ProjectRecord& p) { RecordServing(p, previous, port, error + "; rolled back to " + previous); });
    SANDBOX_LOG_WARN("production rolled back automatically", {StringField("project_id", project_id), StringField("failed", failed_hash),
                                                              StringField("restored", previous)});
  }
}

void ProductionService::Teardown(const std::string& project_id) {
  auto       guard  = locks_.Acquire(project_id);
  const auto status = projects_->Require(project_id).production_status;
  if (status != ProductionStatus::kRunning && status != ProductionStatus::kStopped) {
    throw util::InvalidState("cannot stop production while it is " + std::string(sandbox::model::ToString(status)));
  }

  runtime_->StopProduction(project_id);
  try {
    runtime_->RemoveProductionImages(project_id);
  } catch (const std::exception& e) {
    SANDBOX_LOG_WARN("production image removal failed", {StringField("project_id", project_id), StringField("error", e.what())});
  }

  releases_->RemoveAll(project_id);
  for (const auto& record : ports_->PortsForProject(project_id)) {
    if (record.type == db::model::PortType::kVersion) {
      ports_->UnregisterPort(record.port);
    }
  }

  const auto clear = [](projects::ProjectRecord& p) {
    p.production_hash.clear();
    p.production_url.clear();
    p.production_error.clear();
    p.production_port          = 0;
    p.production_started_at_ms = 0;
  };
  if (status == ProductionStatus::kRunning) {
    TransitionTo(project_id, ProductionStatus::kStopped, clear);
  } else {
    projects_->Update(project_id, clear);
  }
  SANDBOX_LOG_INFO("production stopped", {StringField("project_id", project_id)});
}

} // namespace sandbox::production
