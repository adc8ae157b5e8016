#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/external/container_runtime.hpp"
#include "internal/external/health_probe.hpp"
#include "internal/lock/keyed_mutex.hpp"
#include "internal/ports/port_allocator.hpp"
#include "internal/production/release_store.hpp"
#include "internal/projects/project_store.hpp"
#include "internal/queue/job_enqueuer.hpp"

namespace sandbox::runtime::config {
class RuntimeConfig;
}

namespace sandbox::production {

struct ProductionOptions {
  std::filesystem::path root_dir                = "data/production";
  std::size_t           keep_versions           = 2;
  uint64_t              ready_timeout_ms        = 300000;
  uint64_t              ready_probe_interval_ms = 1000;
  std::string           public_host             = "localhost";

  static ProductionOptions FromConfig(const sandbox::runtime::config::RuntimeConfig& config);
};

struct RollbackResult {
  std::string              hash;
  uint32_t                 port = 0;
  std::string              url;
  std::vector<std::string> removed_versions;
};

struct ProductionStatusView {
  projects::ProjectRecord          project;
  std::optional<queue::JobRecord>  active_job;
};

enum class ReadyCheck {
  kReady,
  kPending,
  kTimedOut,
  // the deployment was stopped or replaced while waiting
  kSuperseded,
};

/*
  Production deployment state machine.

    stopped -> queued -> building -> running
                  \          \
                   -> failed  -> failed -> queued

  User actions (Deploy, Stop, Rollback) validate and enqueue; the job
  handlers drive the steps (BuildRelease, StartRelease, CheckReady,
  Teardown). Steps touching the `current` symlink or the production
  container hold a per-project lock, so a rollback never interleaves
  with a start.
*/
class ProductionService {
 public:
  ProductionService(std::shared_ptr<projects::ProjectStore> projects, std::shared_ptr<queue::JobEnqueuer> enqueuer,
                    std::shared_ptr<ports::PortAllocator> ports, std::shared_ptr<ReleaseStore> releases,
                    std::shared_ptr<external::ContainerRuntime> runtime, std::shared_ptr<external::HealthProbe> probe,
                    ProductionOptions options, util::NowFn now = util::Now);

  // ------------------------------------------------------------------
  // User actions
  // ------------------------------------------------------------------

  // Preview must be running and no deployment active (InvalidState).
  queue::EnqueueResult Deploy(const std::string& project_id);

  // Only a running deployment can be stopped (InvalidState).
  queue::EnqueueResult Stop(const std::string& project_id);

  // Only from running; the status stays running whether or not the switch succeeds.
  RollbackResult Rollback(const std::string& project_id, const std::string& target_hash);

  std::vector<ReleaseVersion> ListVersions(const std::string& project_id);

  ProductionStatusView GetStatus(const std::string& project_id);

  bool HasActiveDeployment(const std::string& project_id);

  // ------------------------------------------------------------------
  // Job steps
  // ------------------------------------------------------------------

  // building; run the build; install the output as a release; enqueue start.
  std::string BuildRelease(const std::string& project_id);

  // Promotes `hash`, starts it on the project's base port, enqueues the readiness check.
  void StartRelease(const std::string& project_id, const std::string& hash);

  /*
    One readiness probe. Ready marks the deployment running; a timeout
    marks it failed and rolls back to `previous_hash` when that release
    still exists.
  */
  ReadyCheck CheckReady(const std::string& project_id, const std::string& hash, const std::string& previous_hash, uint32_t port,
                        uint64_t started_at_ms);

  /*
    Stops the container, removes images and releases, releases version
    ports. running -> stopped; an already stopped project is only cleaned
    up, any other status is InvalidState.
  */
  void Teardown(const std::string& project_id);

  /*
    Records a failed deployment and restores the previous release:
    `previous_hash` when given, else whatever `current` names if that is
    not the failed release. An empty `failed_hash` (failed build) only
    records the failure. The status stays failed after a restore; the
    restored release shows in the hash and error fields. A project that
    cannot move to failed (stopped meanwhile) is left alone.
  */
  void FailDeployment(const std::string& project_id, const std::string& failed_hash, const std::string& previous_hash,
                      const std::string& error);

  std::string UrlFor(uint32_t port) const;

  const ProductionOptions& Options() const {
    return options_;
  }

 private:
  void TransitionTo(const std::string& project_id, sandbox::model::ProductionStatus to, const projects::ProjectStore::Mutator& mutate = {});

  // Repoints `current` and starts the release on `port`; caller holds the project lock.
  void Activate(const std::string& project_id, const std::string& hash, uint32_t port);

  // Best-effort Activate of a previous release; caller holds the project lock.
  bool RestorePrevious(const std::string& project_id, const std::string& previous_hash, uint32_t port);

  // Hash, port, url and error of the release now serving; leaves the status alone.
  void RecordServing(projects::ProjectRecord& p, const std::string& hash, uint32_t port, const std::string& error) const;

  void StopContainerQuietly(const std::string& project_id);

  std::shared_ptr<projects::ProjectStore>     projects_;
  std::shared_ptr<queue::JobEnqueuer>         enqueuer_;
  std::shared_ptr<ports::PortAllocator>       ports_;
  std::shared_ptr<ReleaseStore>               releases_;
  std::shared_ptr<external::ContainerRuntime> runtime_;
  std::shared_ptr<external::HealthProbe>      probe_;
  ProductionOptions                           options_;
  util::NowFn                                 now_;
  lock::KeyedMutex                            locks_;
};

} // namespace sandbox::production
