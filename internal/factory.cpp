#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/api/errors.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/external/docker_cli_runtime.hpp"
#include "internal/external/http_health_probe.hpp"
#include "internal/external/http_session_client.hpp"
#include "internal/grpc/admin_auth.hpp"
#include "internal/grpc/presence_server.hpp"
#include "internal/grpc/production_server.hpp"
#include "internal/grpc/project_server.hpp"
#include "internal/grpc/queue_server.hpp"
#include "internal/handlers/container_handlers.hpp"
#include "internal/handlers/production_handlers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/ports/port_allocator.hpp"
#include "internal/presence/presence_manager.hpp"
#include "internal/production/production_service.hpp"
#include "internal/production/release_store.hpp"
#include "internal/projects/project_store.hpp"
#include "internal/queue/dispatcher.hpp"
#include "internal/queue/handler_registry.hpp"
#include "internal/queue/job_enqueuer.hpp"
#include "internal/queue/job_store.hpp"
#include "internal/service/deployment_service.hpp"
#include "internal/service/presence_service.hpp"
#include "internal/service/project_service.hpp"
#include "internal/service/queue_service.hpp"
#include "internal/service/service_context.hpp"
#if SANDBOX_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SANDBOX_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace sandbox::factory {

using namespace sandbox;
using observability::IntField;
using observability::StringField;

namespace {

// First start only; afterwards the stored settings belong to the operator.
void SeedQueueSettings(db::Repository& repository, uint32_t initial_concurrency) {
  auto tx = repository.Begin();
  if (repository.GetQueueSettings(*tx)) {
    return;
  }

  db::model::QueueSettingsRecord settings;
  settings.concurrency = std::clamp(initial_concurrency, queue::kMinConcurrency, queue::kMaxConcurrency);
  db::ThrowIfDbError(repository.SaveQueueSettings(*tx, settings), "seed queue settings");
  tx->Commit();

  SANDBOX_LOG_INFO("Queue settings seeded", {IntField("concurrency", settings.concurrency)});
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const sandbox::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SANDBOX_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    SANDBOX_LOG_INFO("Using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SANDBOX_DB_POSTGRES
    const auto& pg        = database.postgres();
    const auto  pool_size = pg.pool_size() > 0 ? pg.pool_size() : 8;
    auto        pool      = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pool_size);
    pool->Migrate(db::sql::PostgresSchema());
    SANDBOX_LOG_INFO("Using postgres repository", {IntField("pool_size", pool_size)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SANDBOX_LOG_WARN("Using in-memory repository; jobs and projects are lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const sandbox::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  const auto& dispatcher_config = config.dispatcher();
  const uint32_t max_attempts   = dispatcher_config.default_max_attempts() > 0 ? dispatcher_config.default_max_attempts() : 3;

  app.jobs     = std::make_shared<queue::JobStore>(app.repository, util::Now, max_attempts);
  app.projects = std::make_shared<projects::ProjectStore>(app.repository);

  SeedQueueSettings(*app.repository, dispatcher_config.initial_concurrency());

  auto enqueuer = std::make_shared<queue::JobEnqueuer>(app.jobs);
  auto port_allocator = std::make_shared<ports::PortAllocator>(app.repository, ports::PortAllocatorOptions::FromConfig(config));

  // ------------------------------------------------------------------
  // External collaborators
  // ------------------------------------------------------------------
  auto runtime  = std::make_shared<external::DockerCliRuntime>(external::DockerCliOptions::FromConfig(config));
  auto probe    = std::make_shared<external::HttpHealthProbe>(external::HttpProbeOptions::FromConfig(config));
  auto sessions = std::make_shared<external::HttpSessionClient>(external::HttpSessionOptions::FromConfig(config));

  // ------------------------------------------------------------------
  // Domain
  // ------------------------------------------------------------------
  const auto production_options = production::ProductionOptions::FromConfig(config);
  auto       releases           = std::make_shared<production::ReleaseStore>(production_options.root_dir);

  app.production = std::make_shared<production::ProductionService>(app.projects, enqueuer, port_allocator, releases, runtime, probe,
                                                                   production_options);
  app.presence   = std::make_shared<presence::PresenceManager>(app.projects, enqueuer, probe,
                                                             presence::PresenceOptions::FromConfig(config));

  // ------------------------------------------------------------------
  // Job handlers and dispatcher
  // ------------------------------------------------------------------
  auto registry = std::make_shared<queue::HandlerRegistry>();

  auto container_handlers = std::make_shared<handlers::ContainerJobHandlers>(app.projects, enqueuer, runtime, probe, sessions);
  handlers::ContainerJobHandlers::Register(container_handlers, *registry);

  auto production_handlers = std::make_shared<handlers::ProductionJobHandlers>(app.production);
  handlers::ProductionJobHandlers::Register(production_handlers, *registry);

  app.dispatcher = std::make_shared<queue::Dispatcher>(app.jobs, registry, queue::DispatcherOptions::FromConfig(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.jobs       = app.jobs;
  ctx.projects   = app.projects;
  ctx.ports      = port_allocator;
  ctx.presence   = app.presence;
  ctx.production = app.production;

  auto auth = std::make_shared<sandbox::grpc::AdminAuth>(config.server().admin_token());
  if (!auth->Enabled()) {
    SANDBOX_LOG_WARN("No admin token configured; administrative RPCs are open");
  }

  app.grpc_services.push_back(
      std::make_unique<sandbox::grpc::QueueServer>(std::make_shared<service::QueueService>(ctx), auth));
  app.grpc_services.push_back(
      std::make_unique<sandbox::grpc::PresenceServer>(std::make_shared<service::PresenceService>(ctx)));
  app.grpc_services.push_back(
      std::make_unique<sandbox::grpc::ProductionServer>(std::make_shared<service::DeploymentService>(ctx)));
  app.grpc_services.push_back(
      std::make_unique<sandbox::grpc::ProjectServer>(std::make_shared<service::ProjectService>(ctx), auth));

  SANDBOX_LOG_INFO("Application built", {IntField("handlers", static_cast<int64_t>(registry->Types().size())),
                                         StringField("worker_id", app.dispatcher->WorkerId())});
  return app;
}

} // namespace sandbox::factory
