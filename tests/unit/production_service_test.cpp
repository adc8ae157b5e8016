#include "internal/production/production_service.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/production/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using sandbox::db::model::PortType;
using sandbox::model::ProductionStatus;
using sandbox::model::ProjectStatus;
using sandbox::production::ProductionOptions;
using sandbox::production::ProductionService;
using sandbox::production::ReadyCheck;
using sandbox::testing::FakeContainerRuntime;
using sandbox::testing::FakeHealthProbe;
using sandbox::testing::ManualClock;
using sandbox::testing::TempDir;

// "game-72" hashes onto base port 3042.
constexpr const char* kProject  = "game-72";
constexpr uint32_t    kBasePort = 3042;

struct Fixture {
  ManualClock                                         clock;
  TempDir                                             dir{"production_service"};
  std::shared_ptr<sandbox::queue::JobStore>           store;
  std::shared_ptr<sandbox::projects::ProjectStore>    projects;
  std::shared_ptr<sandbox::queue::JobEnqueuer>        enqueuer;
  std::shared_ptr<sandbox::ports::PortAllocator>      ports;
  std::shared_ptr<sandbox::production::ReleaseStore>  releases;
  std::shared_ptr<FakeContainerRuntime>               runtime;
  std::shared_ptr<FakeHealthProbe>                    probe = std::make_shared<FakeHealthProbe>();
  ProductionOptions                                   options;
  std::unique_ptr<ProductionService>                  production;
  int                                                 deployed_ = 0;

  Fixture() {
    auto repository = std::make_shared<sandbox::db::memory::MemoryRepository>();
    store           = std::make_shared<sandbox::queue::JobStore>(repository, clock.Fn());
    projects        = std::make_shared<sandbox::projects::ProjectStore>(repository, clock.Fn());
    enqueuer        = std::make_shared<sandbox::queue::JobEnqueuer>(store, clock.Fn());
    ports           = std::make_shared<sandbox::ports::PortAllocator>(repository, sandbox::ports::PortAllocatorOptions{},
                                                                      [](uint32_t) { return true; }, clock.Fn());
    releases        = std::make_shared<sandbox::production::ReleaseStore>(dir.Path() / "releases");
    runtime         = std::make_shared<FakeContainerRuntime>(dir.Path() / "work");

    options.root_dir         = dir.Path() / "releases";
    options.ready_timeout_ms = 10000;
    production = std::make_unique<ProductionService>(projects, enqueuer, ports, releases, runtime, probe, options, clock.Fn());

    sandbox::db::model::ProjectRecord project;
    project.id           = kProject;
    project.name         = "Game";
    project.path_on_disk = (dir.Path() / "src").string();
    project.status       = ProjectStatus::kRunning;
    projects->Create(project);
  }

  // Runs build, start and a successful readiness check; returns the hash.
  std::string DeployVersion(const std::string& html) {
    runtime->SetBuildOutput(html);
    production->Deploy(kProject);
    const auto hash = production->BuildRelease(kProject);
    production->StartRelease(kProject, hash);

    probe->production_ready = true;
    const auto project      = projects->Require(kProject);
    assert(production->CheckReady(kProject, hash, "", project.production_port, project.production_started_at_ms) == ReadyCheck::kReady);
    probe->production_ready = false;

    // Spread release mtimes so cleanup order is deterministic.
    std::filesystem::last_write_time(releases->ReleaseDir(kProject, hash),
                                     std::filesystem::file_time_type::clock::now() - std::chrono::seconds(1000 - 100 * deployed_++));
    return hash;
  }

  uint64_t CountJobs(const char* type) {
    sandbox::db::JobFilter filter;
    filter.project_id = kProject;
    filter.type       = type;
    return store->CountJobs(filter);
  }
};

void TestDeployRequiresRunningPreview() {
  Fixture f;
  f.projects->SetStatus(kProject, ProjectStatus::kStopped);

  bool threw = false;
  try {
    f.production->Deploy(kProject);
  } catch (const sandbox::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.projects->Require(kProject).production_status == ProductionStatus::kStopped);
}

void TestFirstDeployRunsOnBasePort() {
  Fixture f;
  const auto queued = f.production->Deploy(kProject);
  assert(queued.job.type == sandbox::queue::job_types::kProductionBuild);
  assert(f.projects->Require(kProject).production_status == ProductionStatus::kQueued);

  const auto hash = f.production->BuildRelease(kProject);
  assert(hash.size() == 8);
  assert(hash == sandbox::production::ContentHash(f.dir.Path() / "work" / kProject / "dist"));
  assert(f.projects->Require(kProject).production_status == ProductionStatus::kBuilding);
  assert(f.CountJobs(sandbox::queue::job_types::kProductionStart) == 1);

  f.production->StartRelease(kProject, hash);
  assert(f.runtime->RunningHash() == hash);
  assert(f.runtime->RunningPort() == kBasePort);
  assert(f.releases->CurrentHash(kProject) == hash);
  assert(f.CountJobs(sandbox::queue::job_types::kProductionWaitReady) == 1);

  // Version port is recorded alongside the base port.
  bool has_version = false;
  for (const auto& record : f.ports->PortsForProject(kProject)) {
    if (record.type == PortType::kVersion) {
      has_version = record.hash == hash && record.port == f.ports->DeriveVersionPort(kProject, hash);
    }
  }
  assert(has_version);

  const auto started = f.projects->Require(kProject).production_started_at_ms;
  assert(f.production->CheckReady(kProject, hash, "", kBasePort, started) == ReadyCheck::kPending);

  f.probe->production_ready = true;
  assert(f.production->CheckReady(kProject, hash, "", kBasePort, started) == ReadyCheck::kReady);

  const auto project = f.projects->Require(kProject);
  assert(project.production_status == ProductionStatus::kRunning);
  assert(project.production_hash == hash);
  assert(project.production_port == kBasePort);
  assert(project.production_url == "http://localhost:3042");
}

void TestDeployWhileActiveIsRejected() {
  Fixture f;
  f.production->Deploy(kProject);
  assert(f.production->HasActiveDeployment(kProject));

  bool threw = false;
  try {
    f.production->Deploy(kProject);
  } catch (const sandbox::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.CountJobs(sandbox::queue::job_types::kProductionBuild) == 1);
}

void TestSecondDeployAndRollback() {
  Fixture f;
  const auto h1 = f.DeployVersion("<html>v1</html>");
  const auto h2 = f.DeployVersion("<html>v2</html>");
  assert(h1 != h2);
  assert(f.runtime->RunningHash() == h2);
  assert(f.runtime->RunningPort() == kBasePort);

  const auto versions = f.production->ListVersions(kProject);
  assert(versions.size() == 2);

  // Already active.
  bool threw = false;
  try {
    f.production->Rollback(kProject, h2);
  } catch (const sandbox::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.production->Rollback(kProject, "deadbeef");
  } catch (const sandbox::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  const auto result = f.production->Rollback(kProject, h1);
  assert(result.hash == h1);
  assert(result.port == kBasePort);
  assert(result.url == "http://localhost:3042");
  assert(f.runtime->RunningHash() == h1);
  assert(f.releases->CurrentHash(kProject) == h1);

  const auto project = f.projects->Require(kProject);
  assert(project.production_status == ProductionStatus::kRunning);
  assert(project.production_hash == h1);
}

void TestCleanupKeepsConfiguredVersions() {
  Fixture f;
  f.DeployVersion("<html>v1</html>");
  f.DeployVersion("<html>v2</html>");
  const auto h3 = f.DeployVersion("<html>v3</html>");

  const auto versions = f.production->ListVersions(kProject);
  assert(versions.size() == f.options.keep_versions);
  bool has_current = false;
  for (const auto& version : versions) {
    if (version.hash == h3) has_current = version.is_active;
  }
  assert(has_current);
}

void TestStartFailureRestoresPrevious() {
  Fixture f;
  const auto h1 = f.DeployVersion("<html>v1</html>");

  f.runtime->SetBuildOutput("<html>broken</html>");
  f.production->Deploy(kProject);
  const auto h2 = f.production->BuildRelease(kProject);
  f.runtime->FailStartFor(h2);

  bool threw = false;
  try {
    f.production->StartRelease(kProject, h2);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(f.runtime->RunningHash() == h1);
  assert(f.releases->CurrentHash(kProject) == h1);

  // Final attempt gives up.
  f.production->FailDeployment(kProject, h2, h1, "container failed to start");
  const auto project = f.projects->Require(kProject);
  assert(project.production_status == ProductionStatus::kFailed);
  assert(project.production_hash == h1);
  assert(project.production_port == kBasePort);
  assert(project.production_error.find("rolled back to " + h1) != std::string::npos);
}

void TestReadyTimeoutRollsBack() {
  Fixture f;
  const auto h1 = f.DeployVersion("<html>v1</html>");

  f.runtime->SetBuildOutput("<html>slow</html>");
  f.production->Deploy(kProject);
  const auto h2 = f.production->BuildRelease(kProject);
  f.production->StartRelease(kProject, h2);
  const auto started = f.projects->Require(kProject).production_started_at_ms;

  f.clock.Advance(f.options.ready_timeout_ms / 2);
  assert(f.production->CheckReady(kProject, h2, h1, kBasePort, started) == ReadyCheck::kPending);

  f.clock.Advance(f.options.ready_timeout_ms);
  assert(f.production->CheckReady(kProject, h2, h1, kBasePort, started) == ReadyCheck::kTimedOut);

  const auto project = f.projects->Require(kProject);
  assert(project.production_hash == h1);
  assert(project.production_status == ProductionStatus::kFailed);
  assert(project.production_error.find("rolled back to " + h1) != std::string::npos);
  assert(f.runtime->RunningHash() == h1);

  // A late check for the replaced release is a no-op.
  assert(f.production->CheckReady(kProject, h2, h1, kBasePort, started) == ReadyCheck::kSuperseded);
}

void TestFirstDeployTimeoutFails() {
  Fixture f;
  f.production->Deploy(kProject);
  const auto hash = f.production->BuildRelease(kProject);
  f.production->StartRelease(kProject, hash);
  const auto started = f.projects->Require(kProject).production_started_at_ms;

  f.clock.Advance(f.options.ready_timeout_ms);
  assert(f.production->CheckReady(kProject, hash, "", kBasePort, started) == ReadyCheck::kTimedOut);
  assert(f.projects->Require(kProject).production_status == ProductionStatus::kFailed);

  // Failed deployments can be retried.
  f.production->Deploy(kProject);
  assert(f.projects->Require(kProject).production_status == ProductionStatus::kQueued);
}

void TestBuildFailureOnlyRecordsError() {
  Fixture f;
  const auto h1 = f.DeployVersion("<html>v1</html>");

  f.production->Deploy(kProject);
  f.runtime->FailBuild(true);
  bool threw = false;
  try {
    f.production->BuildRelease(kProject);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  f.production->FailDeployment(kProject, "", "", "build failed");
  const auto project = f.projects->Require(kProject);
  assert(project.production_status == ProductionStatus::kFailed);
  assert(project.production_error == "build failed");
  assert(f.releases->CurrentHash(kProject) == h1);
  assert(f.runtime->RunningHash() == h1);
}

void TestTeardownRemovesEverything() {
  Fixture f;
  f.DeployVersion("<html>v1</html>");
  f.DeployVersion("<html>v2</html>");

  const auto stop = f.production->Stop(kProject);
  assert(stop.job.type == sandbox::queue::job_types::kProductionStop);

  f.production->Teardown(kProject);
  assert(f.runtime->RunningHash().empty());
  assert(f.runtime->RemoveImagesCalls() == 1);
  assert(!std::filesystem::exists(f.releases->ProjectDir(kProject)));

  for (const auto& record : f.ports->PortsForProject(kProject)) {
    assert(record.type != PortType::kVersion);
  }

  const auto project = f.projects->Require(kProject);
  assert(project.production_status == ProductionStatus::kStopped);
  assert(project.production_hash.empty());
  assert(project.production_port == 0);
  assert(project.production_url.empty());
}

void TestRollbackFromFailedIsRejected() {
  Fixture f;
  const auto h1 = f.DeployVersion("<html>v1</html>");
  const auto h2 = f.DeployVersion("<html>v2</html>");

  f.production->Deploy(kProject);
  f.production->FailDeployment(kProject, "", "", "build failed");
  assert(f.projects->Require(kProject).production_status == ProductionStatus::kFailed);

  bool threw = false;
  try {
    f.production->Rollback(kProject, h1);
  } catch (const sandbox::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.projects->Require(kProject).production_status == ProductionStatus::kFailed);
  assert(f.releases->CurrentHash(kProject) == h2);
  assert(f.runtime->RunningHash() == h2);

  // failed only leads back to queued.
  f.production->Deploy(kProject);
  assert(f.projects->Require(kProject).production_status == ProductionStatus::kQueued);
}

void TestFailedRollbackKeepsRunning() {
  Fixture f;
  const auto h1 = f.DeployVersion("<html>v1</html>");
  const auto h2 = f.DeployVersion("<html>v2</html>");
  f.runtime->FailStartFor(h1);

  bool threw = false;
  try {
    f.production->Rollback(kProject, h1);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  const auto project = f.projects->Require(kProject);
  assert(project.production_status == ProductionStatus::kRunning);
  assert(project.production_hash == h2);
  assert(project.production_error.find("rollback to " + h1) != std::string::npos);
  assert(f.runtime->RunningHash() == h2);
  assert(f.releases->CurrentHash(kProject) == h2);
}

void TestStopOnlyFromRunning() {
  Fixture f;

  bool threw = false;
  try {
    f.production->Stop(kProject);
  } catch (const sandbox::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  f.production->Deploy(kProject);
  f.production->BuildRelease(kProject);
  threw = false;
  try {
    f.production->Teardown(kProject);
  } catch (const sandbox::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.projects->Require(kProject).production_status == ProductionStatus::kBuilding);
}

void TestTeardownOfStoppedProjectOnlyCleansUp() {
  Fixture f;
  f.production->Teardown(kProject);
  assert(f.projects->Require(kProject).production_status == ProductionStatus::kStopped);
  assert(f.runtime->RemoveImagesCalls() == 1);
}

void TestFailureAfterStopIsIgnored() {
  Fixture f;
  f.production->FailDeployment(kProject, "", "", "build failed");
  const auto project = f.projects->Require(kProject);
  assert(project.production_status == ProductionStatus::kStopped);
  assert(project.production_error.empty());
}

void TestStatusReportsActiveJob() {
  Fixture f;
  auto view = f.production->GetStatus(kProject);
  assert(!view.active_job);

  const auto queued = f.production->Deploy(kProject);
  view              = f.production->GetStatus(kProject);
  assert(view.project.production_status == ProductionStatus::kQueued);
  assert(view.active_job && view.active_job->id == queued.job.id);
}

} // namespace

int main() {
  TestDeployRequiresRunningPreview();
  TestFirstDeployRunsOnBasePort();
  TestDeployWhileActiveIsRejected();
  TestSecondDeployAndRollback();
  TestCleanupKeepsConfiguredVersions();
  TestStartFailureRestoresPrevious();
  TestReadyTimeoutRollsBack();
  TestFirstDeployTimeoutFails();
  TestBuildFailureOnlyRecordsError();
  TestTeardownRemovesEverything();
  TestRollbackFromFailedIsRejected();
  TestFailedRollbackKeepsRunning();
  TestStopOnlyFromRunning();
  TestTeardownOfStoppedProjectOnlyCleansUp();
  TestFailureAfterStopIsIgnored();
  TestStatusReportsActiveJob();

  std::cout << "sandbox_unit_production_service: pass\n";
  return 0;
}
