#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/presence/presence_manager.hpp"
#include "internal/projects/project_store.hpp"
#include "internal/queue/job_enqueuer.hpp"
#include "internal/queue/job_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "support/fakes.hpp"

#if SANDBOX_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SANDBOX_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#endif

namespace {

using sandbox::db::ErrorCode;
using sandbox::db::JobFilter;
using sandbox::db::Pagination;
using sandbox::db::Repository;
using sandbox::db::memory::MemoryRepository;
using sandbox::db::model::JobRecord;
using sandbox::db::model::PortRecord;
using sandbox::db::model::PortType;
using sandbox::db::model::ProjectRecord;
using sandbox::db::model::QueueSettingsRecord;
using sandbox::model::JobState;
using sandbox::model::ProductionStatus;
using sandbox::model::ProjectStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

JobRecord MakeJob(const std::string& id, const std::string& type, const std::string& project_id, uint64_t created_at_ms) {
  JobRecord job;
  job.id            = id;
  job.type          = type;
  job.project_id    = project_id;
  job.payload_json  = R"({"projectId":")" + project_id + R"("})";
  job.run_at_ms     = created_at_ms;
  job.created_at_ms = created_at_ms;
  job.updated_at_ms = created_at_ms;
  return job;
}

bool Contains(const std::vector<JobRecord>& jobs, const std::string& id) {
  for (const auto& job : jobs) {
    if (job.id == id) return true;
  }
  return false;
}

void VerifyJobLifecycle(Repository& repo, const std::string& prefix) {
  const auto project = prefix + "-life";
  const auto key     = "docker.composeUp:" + project;
  const auto now     = NowMs();

  auto first          = MakeJob(prefix + "-job-1", "docker.composeUp", project, now);
  first.dedupe_key    = key;
  first.dedupe_active = true;

  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, first));

    auto duplicate          = MakeJob(prefix + "-job-2", "docker.composeUp", project, now);
    duplicate.dedupe_key    = key;
    duplicate.dedupe_active = true;
    assert(repo.InsertJob(*tx, duplicate).code == ErrorCode::ConstraintViolation);

    const auto active = repo.FindActiveJobByDedupeKey(*tx, key);
    assert(active && active->id == first.id);
    tx->Commit();
  }

  // Claim.
  {
    auto tx      = repo.Begin();
    auto claimed = *repo.GetJob(*tx, first.id);
    assert(claimed.state == JobState::kQueued);
    assert(!claimed.locked_at_ms);
    assert(claimed.payload_json == first.payload_json);

    claimed.state              = JobState::kRunning;
    claimed.locked_by          = "worker-a";
    claimed.locked_at_ms       = now;
    claimed.lock_expires_at_ms = now + 60000;
    claimed.attempts           = 1;
    assert(repo.UpdateJobIf(*tx, claimed, JobState::kQueued, ""));

    // Stale expectations lose.
    assert(repo.UpdateJobIf(*tx, claimed, JobState::kQueued, "").code == ErrorCode::Conflict);
    assert(repo.UpdateJobIf(*tx, claimed, JobState::kRunning, "worker-b").code == ErrorCode::Conflict);
    assert(repo.DeleteJob(*tx, first.id).code == ErrorCode::Conflict);
    tx->Commit();
  }

  // Finish; the dedupe slot is released.
  {
    auto tx   = repo.Begin();
    auto done = *repo.GetJob(*tx, first.id);
    assert(done.locked_by == "worker-a");
    assert(done.lock_expires_at_ms == now + 60000);

    done.state         = JobState::kSucceeded;
    done.dedupe_active = false;
    done.ClearLock();
    assert(repo.UpdateJobIf(*tx, done, JobState::kRunning, "worker-a"));
    assert(!repo.FindActiveJobByDedupeKey(*tx, key));

    auto again          = MakeJob(prefix + "-job-3", "docker.composeUp", project, now + 1);
    again.dedupe_key    = key;
    again.dedupe_active = true;
    assert(repo.InsertJob(*tx, again));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteJob(*tx, first.id));
    assert(!repo.GetJob(*tx, first.id));
    assert(repo.DeleteJob(*tx, first.id).code == ErrorCode::NotFound);

    auto ghost = MakeJob(prefix + "-ghost", "t", "", now);
    assert(repo.UpdateJobIf(*tx, ghost, JobState::kQueued, "").code == ErrorCode::NotFound);
    tx->Commit();
  }
}

void VerifyOptionalFields(Repository& repo, const std::string& prefix) {
  auto job                   = MakeJob(prefix + "-opt", "session.create", "", NowMs());
  job.state                  = JobState::kCancelled;
  job.cancel_requested_at_ms = job.created_at_ms + 5;
  job.cancelled_at_ms        = job.created_at_ms + 10;
  job.last_error             = "cancelled by operator";
  job.priority               = -3;
  job.max_attempts           = 7;

  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, job));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto read = repo.GetJob(*tx, job.id);
  assert(read);
  assert(read->project_id.empty());
  assert(read->dedupe_key.empty());
  assert(!read->dedupe_active);
  assert(read->state == JobState::kCancelled);
  assert(read->cancel_requested_at_ms == job.cancel_requested_at_ms);
  assert(read->cancelled_at_ms == job.cancelled_at_ms);
  assert(!read->locked_at_ms);
  assert(read->last_error == job.last_error);
  assert(read->priority == -3);
  assert(read->max_attempts == 7);
  tx->Commit();
}

void VerifyJobQueries(Repository& repo, const std::string& prefix) {
  const auto project = prefix + "-query";
  const auto base    = NowMs();

  {
    auto tx = repo.Begin();
    for (int i = 0; i < 5; ++i) {
      auto job = MakeJob(prefix + "-q" + std::to_string(i), i % 2 == 0 ? "production.build" : "docker.stop", project, base + i);
      if (i == 4) {
        job.state      = JobState::kFailed;
        job.last_error = "npm run build exited with 1";
      }
      assert(repo.InsertJob(*tx, job));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  JobFilter by_project;
  by_project.project_id = project;
  assert(repo.CountJobs(*tx, by_project) == 5);

  const auto all = repo.ListJobs(*tx, by_project, Pagination{});
  assert(all.size() == 5);
  assert(all.front().id == prefix + "-q4");
  assert(all.back().id == prefix + "-q0");

  Pagination page;
  page.limit  = 2;
  page.offset = 1;
  const auto middle = repo.ListJobs(*tx, by_project, page);
  assert(middle.size() == 2);
  assert(middle[0].id == prefix + "-q3");
  assert(middle[1].id == prefix + "-q2");

  JobFilter by_type = by_project;
  by_type.type      = "docker.stop";
  assert(repo.CountJobs(*tx, by_type) == 2);

  JobFilter by_state = by_project;
  by_state.state     = JobState::kFailed;
  const auto failed  = repo.ListJobs(*tx, by_state, Pagination{});
  assert(failed.size() == 1 && failed[0].id == prefix + "-q4");

  JobFilter by_text = by_project;
  by_text.text      = "exited with";
  assert(repo.CountJobs(*tx, by_text) == 1);
  by_text.text = project;
  assert(repo.CountJobs(*tx, by_text) == 5);

  tx->Commit();
}

void VerifyRunnableSelection(Repository& repo, const std::string& prefix) {
  const auto now  = NowMs();
  const auto busy = prefix + "-busy";
  const auto idle = prefix + "-idle";

  {
    auto tx = repo.Begin();

    auto running               = MakeJob(prefix + "-r-running", "docker.composeUp", busy, now - 100);
    running.state              = JobState::kRunning;
    running.locked_by          = "worker-a";
    running.locked_at_ms       = now - 100;
    running.lock_expires_at_ms = now + 60000;
    assert(repo.InsertJob(*tx, running));
    // Same project as a running job.
    assert(repo.InsertJob(*tx, MakeJob(prefix + "-r-blocked", "docker.stop", busy, now - 50)));

    auto late     = MakeJob(prefix + "-r-late", "docker.stop", idle, now - 40);
    auto early    = MakeJob(prefix + "-r-early", "docker.stop", idle, now - 80);
    auto urgent   = MakeJob(prefix + "-r-urgent", "docker.stop", idle, now - 10);
    urgent.priority = 5;
    auto future   = MakeJob(prefix + "-r-future", "docker.stop", idle, now);
    future.run_at_ms = now + 60000;
    assert(repo.InsertJob(*tx, late));
    assert(repo.InsertJob(*tx, early));
    assert(repo.InsertJob(*tx, urgent));
    assert(repo.InsertJob(*tx, future));
    tx->Commit();
  }

  auto tx       = repo.Begin();
  auto runnable = repo.ListRunnableJobs(*tx, now, 1000);
  tx->Commit();

  std::vector<std::string> mine;
  for (const auto& job : runnable) {
    if (job.id.rfind(prefix + "-r-", 0) == 0) mine.push_back(job.id);
  }
  assert(mine.size() == 3);
  assert(mine[0] == prefix + "-r-urgent");
  assert(mine[1] == prefix + "-r-early");
  assert(mine[2] == prefix + "-r-late");
  assert(!Contains(runnable, prefix + "-r-blocked"));
  assert(!Contains(runnable, prefix + "-r-future"));
  assert(!Contains(runnable, prefix + "-r-running"));
}

void VerifyDeleteByState(Repository& repo, const std::string& prefix) {
  const auto now = NowMs();
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 3; ++i) {
      auto job  = MakeJob(prefix + "-del" + std::to_string(i), "t", prefix + "-del", now);
      job.state = i < 2 ? JobState::kSucceeded : JobState::kQueued;
      assert(repo.InsertJob(*tx, job));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.DeleteJobsInState(*tx, JobState::kSucceeded) >= 2);
  assert(!repo.GetJob(*tx, prefix + "-del0"));
  assert(!repo.GetJob(*tx, prefix + "-del1"));
  assert(repo.GetJob(*tx, prefix + "-del2"));
  tx->Commit();
}

void VerifyQueueSettings(Repository& repo) {
  std::optional<QueueSettingsRecord> original;
  {
    auto tx  = repo.Begin();
    original = repo.GetQueueSettings(*tx);
    tx->Commit();
  }

  {
    auto                tx = repo.Begin();
    QueueSettingsRecord settings;
    settings.paused      = true;
    settings.concurrency = 7;
    assert(repo.SaveQueueSettings(*tx, settings));
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto read = repo.GetQueueSettings(*tx);
    assert(read && read->paused && read->concurrency == 7);
    if (original) assert(repo.SaveQueueSettings(*tx, *original));
    tx->Commit();
  }
}

void VerifyPorts(Repository& repo, const std::string& prefix, uint32_t first_port) {
  const auto project = prefix + "-ports";

  PortRecord base;
  base.port          = first_port;
  base.type          = PortType::kBase;
  base.project_id    = project;
  base.created_at_ms = NowMs();
  base.updated_at_ms = base.created_at_ms;

  PortRecord version = base;
  version.port       = first_port + 1;
  version.type       = PortType::kVersion;
  version.hash       = "a1b2c3d4";

  {
    auto tx = repo.Begin();
    assert(repo.InsertPort(*tx, base));
    assert(repo.InsertPort(*tx, version));

    PortRecord clash = base;
    clash.project_id = prefix + "-other";
    assert(repo.InsertPort(*tx, clash).code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto read = repo.GetPort(*tx, version.port);
    assert(read);
    assert(read->type == PortType::kVersion);
    assert(read->project_id == project);
    assert(read->hash == "a1b2c3d4");
    assert(repo.ListPortsForProject(*tx, project).size() == 2);

    assert(repo.DeletePort(*tx, version.port));
    assert(!repo.GetPort(*tx, version.port));
    assert(repo.ListPortsForProject(*tx, project).size() == 1);
    tx->Commit();
  }
}

void VerifyProjects(Repository& repo, const std::string& prefix) {
  ProjectRecord project;
  project.id            = prefix + "-proj";
  project.name          = "Parity";
  project.path_on_disk  = "/srv/projects/" + project.id;
  project.dev_port      = 41001;
  project.runtime_port  = 41002;
  project.created_at_ms = NowMs();
  project.updated_at_ms = project.created_at_ms;

  {
    auto tx = repo.Begin();
    assert(repo.InsertProject(*tx, project));
    assert(repo.InsertProject(*tx, project).code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  {
    auto tx                           = repo.Begin();
    auto stored                       = *repo.GetProject(*tx, project.id);
    stored.status                     = ProjectStatus::kRunning;
    stored.production_status          = ProductionStatus::kRunning;
    stored.production_hash            = "a1b2c3d4";
    stored.production_port            = 3042;
    stored.production_url             = "http://localhost:3042";
    stored.production_started_at_ms   = project.created_at_ms + 1;
    assert(repo.UpdateProject(*tx, stored));

    ProjectRecord missing;
    missing.id = prefix + "-missing";
    assert(repo.UpdateProject(*tx, missing).code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto read = repo.GetProject(*tx, project.id);
  assert(read);
  assert(read->name == "Parity");
  assert(read->status == ProjectStatus::kRunning);
  assert(read->production_status == ProductionStatus::kRunning);
  assert(read->production_hash == "a1b2c3d4");
  assert(read->production_port == 3042);
  assert(read->production_error.empty());
  assert(read->dev_port == 41001 && read->runtime_port == 41002);

  bool listed = false;
  for (const auto& p : repo.ListProjects(*tx)) {
    listed = listed || p.id == project.id;
  }
  assert(listed);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob(prefix + "-rolled", "t", "", NowMs())));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob(prefix + "-dropped", "t", "", NowMs())));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!tx->Finished());
  assert(!repo.GetJob(*tx, prefix + "-rolled"));
  assert(!repo.GetJob(*tx, prefix + "-dropped"));
  tx->Commit();
  assert(tx->Finished());

  bool rejected = false;
  try {
    tx->Commit();
  } catch (const sandbox::util::InvalidState&) {
    rejected = true;
  }
  assert(rejected);
  tx->Rollback();

  // The finished transaction released its lock.
  auto next = repo.Begin();
  next->Commit();
}

// Simultaneous stop requests for one project collapse into one job per lineage.
void VerifyConcurrentDedupe(const std::shared_ptr<Repository>& repo, const std::string& prefix) {
  const auto project  = prefix + "-dedupe";
  auto       store    = std::make_shared<sandbox::queue::JobStore>(repo);
  auto       enqueuer = std::make_shared<sandbox::queue::JobEnqueuer>(store);

  auto burst = [&] {
    std::mutex               mutex;
    std::set<std::string>    ids;
    std::vector<std::thread> workers;
    for (int t = 0; t < 6; ++t) {
      workers.emplace_back([&] {
        for (int i = 0; i < 10; ++i) {
          const auto result = enqueuer->EnqueueDockerStop(project, "idle");
          std::lock_guard<std::mutex> lock(mutex);
          ids.insert(result.job.id);
        }
      });
    }
    for (auto& worker : workers) worker.join();
    return ids;
  };

  const auto first = burst();
  assert(first.size() == 1);

  store->Cancel(*first.begin());
  const auto second = burst();
  assert(second.size() == 1);
  assert(*second.begin() != *first.begin());

  JobFilter filter;
  filter.project_id = project;
  assert(store->CountJobs(filter) == 2);
  filter.state = JobState::kQueued;
  assert(store->CountJobs(filter) == 1);
}

// Racing heartbeats for a stopped project enqueue exactly one start.
void VerifyConcurrentHeartbeats(const std::shared_ptr<Repository>& repo, const std::string& prefix) {
  const auto project_id = prefix + "-presence";
  auto       projects   = std::make_shared<sandbox::projects::ProjectStore>(repo);
  auto       store      = std::make_shared<sandbox::queue::JobStore>(repo);
  auto       enqueuer   = std::make_shared<sandbox::queue::JobEnqueuer>(store);
  auto       probe      = std::make_shared<sandbox::testing::FakeHealthProbe>();

  ProjectRecord project;
  project.id           = project_id;
  project.name         = "Presence";
  project.path_on_disk = "/srv/projects/" + project_id;
  project.dev_port     = 41001;
  project.runtime_port = 41002;
  projects->Create(project);

  sandbox::presence::PresenceManager presence(projects, enqueuer, probe, sandbox::presence::PresenceOptions{});

  std::vector<std::thread> viewers;
  for (int v = 0; v < 6; ++v) {
    viewers.emplace_back([&, v] {
      for (int i = 0; i < 5; ++i) {
        const auto result = presence.HandleHeartbeat(project_id, "viewer-" + std::to_string(v));
        assert(result.status == ProjectStatus::kStarting);
      }
    });
  }
  for (auto& viewer : viewers) viewer.join();

  JobFilter filter;
  filter.project_id = project_id;
  filter.type       = sandbox::queue::job_types::kDockerComposeUp;
  assert(store->CountJobs(filter) == 1);
  assert(projects->Require(project_id).status == ProjectStatus::kStarting);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) return;

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertJob(*tx, MakeJob(prefix + "-durable", "docker.stop", prefix + "-durable", NowMs())));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto read = repo->GetJob(*tx, prefix + "-durable");
  assert(read && read->type == "docker.stop");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if SANDBOX_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = (std::filesystem::temp_directory_path() / ("sandbox_parity_" + sandbox::util::RandomSuffix(8) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<sandbox::db::sqlite::SqliteDB>(db_path);
    sandbox::db::sql::RunMigrations(*db, sandbox::db::sql::SqliteSchema());
    return std::make_shared<sandbox::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::error_code ec;
        std::filesystem::remove(db_path, ec);
        std::filesystem::remove(db_path + "-wal", ec);
        std::filesystem::remove(db_path + "-shm", ec);
      },
  };
}
#endif

#if SANDBOX_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SANDBOX_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SANDBOX_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<sandbox::db::postgres::PgPool>(conninfo, 4);
    pool->Migrate(sandbox::db::sql::PostgresSchema());
    return std::make_shared<sandbox::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}

// Connections go back to the pool and a full pool times out.
void VerifyPoolBounds(const std::string& conninfo) {
  auto pool = std::make_shared<sandbox::db::postgres::PgPool>(conninfo, 2, std::chrono::milliseconds(100));
  {
    auto first  = pool->Acquire();
    auto second = pool->Acquire();
    assert(pool->Snapshot().live == 2);

    bool exhausted = false;
    try {
      (void)pool->Acquire();
    } catch (const sandbox::util::StorageError& e) {
      exhausted = e.transient();
    }
    assert(exhausted);
  }
  const auto stats = pool->Snapshot();
  assert(stats.live == 2 && stats.idle == 2);
  auto reused = pool->Acquire();
  assert(pool->Snapshot().idle == 1);
}
#endif

void RunBackendSuite(BackendFactory& backend, uint32_t first_port) {
  std::cout << "running backend suite: " << backend.name << "\n";
  // Shared databases keep rows from earlier runs.
  const auto prefix = backend.name + "-" + sandbox::util::RandomSuffix(8);
  auto       repo   = backend.make_repository();

  VerifyJobLifecycle(*repo, prefix);
  VerifyOptionalFields(*repo, prefix);
  VerifyJobQueries(*repo, prefix);
  VerifyRunnableSelection(*repo, prefix);
  VerifyDeleteByState(*repo, prefix);
  VerifyQueueSettings(*repo);
  VerifyPorts(*repo, prefix, first_port);
  VerifyProjects(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifyConcurrentDedupe(repo, prefix);
  VerifyConcurrentHeartbeats(repo, prefix);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SANDBOX_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SANDBOX_DB_POSTGRES
  try {
    auto postgres = MakePostgresFactory();
    VerifyPoolBounds(std::getenv("SANDBOX_TEST_POSTGRES_URI"));
    backends.push_back(std::move(postgres));
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    // Random port base so reruns against a shared database do not collide.
    const auto first_port = 20000 + static_cast<uint32_t>(std::hash<std::string>{}(sandbox::util::RandomSuffix(8)) % 20000);
    RunBackendSuite(backend, first_port);
  }

  std::cout << "sandbox_integration_repository_parity: pass\n";
  return 0;
}
