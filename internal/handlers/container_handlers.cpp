#include "container_handlers.hpp"

#include "internal/observability/logging.hpp"
#include "internal/queue/payload_codec.hpp"
#include "sandbox/orchestrator/v1/job_payloads.pb.h"

namespace sandbox::handlers {

namespace v1 = sandbox::orchestrator::v1;

using observability::IntField;
using observability::StringField;
using sandbox::model::ProjectStatus;

ContainerJobHandlers::ContainerJobHandlers(std::shared_ptr<projects::ProjectStore> projects, std::shared_ptr<queue::JobEnqueuer> enqueuer,
                                           std::shared_ptr<external::ContainerRuntime> runtime,
                                           std::shared_ptr<external::HealthProbe> probe, std::shared_ptr<external::SessionClient> sessions,
                                           ContainerHandlerOptions options)
    : projects_(std::move(projects)),
      enqueuer_(std::move(enqueuer)),
      runtime_(std::move(runtime)),
      probe_(std::move(probe)),
      sessions_(std::move(sessions)),
      options_(options) {
}

void ContainerJobHandlers::Register(const std::shared_ptr<ContainerJobHandlers>& self, queue::HandlerRegistry& registry) {
  registry.Register(queue::job_types::kDockerComposeUp, [self](queue::JobContext& ctx) { self->ComposeUp(ctx); });
  registry.Register(queue::job_types::kDockerWaitReady, [self](queue::JobContext& ctx) { self->WaitReady(ctx); });
  registry.Register(queue::job_types::kDockerStop, [self](queue::JobContext& ctx) { self->Stop(ctx); });
  registry.Register(queue::job_types::kSessionCreate, [self](queue::JobContext& ctx) { self->CreateSession(ctx); });
}

std::optional<projects::ProjectRecord> ContainerJobHandlers::LoadTarget(const queue::JobContext& ctx, const std::string& project_id) {
  if (project_id.empty()) {
    throw queue::PermanentJobError(ctx.Type() + " payload has no project id");
  }
  auto project = projects_->Get(project_id);
  if (!project) {
    SANDBOX_LOG_WARN("project not found for job", {StringField("job_id", ctx.Id()), StringField("type", ctx.Type()),
                                                   StringField("project_id", project_id)});
    return std::nullopt;
  }
  if (project->status == ProjectStatus::kDeleting) {
    SANDBOX_LOG_INFO("skipping job for deleting project", {StringField("job_id", ctx.Id()), StringField("type", ctx.Type()),
                                                           StringField("project_id", project_id)});
    return std::nullopt;
  }
  return project;
}

void ContainerJobHandlers::ComposeUp(queue::JobContext& ctx) {
  const auto payload = queue::DecodePayload<v1::ContainerJobPayload>(ctx.PayloadJson());
  auto       project = LoadTarget(ctx, payload.project_id());
  if (!project) return;

  ctx.ThrowIfCancelRequested();
  if (project->status != ProjectStatus::kStarting) {
    projects_->SetStatus(project->id, ProjectStatus::kStarting);
  }

  try {
    runtime_->ComposeUp(*project);
  } catch (const std::exception&) {
    if (ctx.IsFinalAttempt()) {
      projects_->SetStatus(project->id, ProjectStatus::kError);
    }
    throw;
  }

  ctx.ThrowIfCancelRequested();
  auto next = enqueuer_->EnqueueDockerWaitReady(project->id, ctx.NowMs());
  SANDBOX_LOG_INFO("compose up finished", {StringField("project_id", project->id), StringField("reason", payload.reason()),
                                           StringField("next_job_id", next.job.id)});
}

void ContainerJobHandlers::WaitReady(queue::JobContext& ctx) {
  const auto payload = queue::DecodePayload<v1::ContainerJobPayload>(ctx.PayloadJson());
  auto       project = LoadTarget(ctx, payload.project_id());
  if (!project) return;

  ctx.ThrowIfCancelRequested();

  const auto now_ms  = ctx.NowMs();
  const auto elapsed = now_ms > payload.started_at_ms() ? now_ms - payload.started_at_ms() : 0;
  if (elapsed > options_.wait_ready_timeout_ms) {
    projects_->SetStatus(project->id, ProjectStatus::kError);
    throw queue::PermanentJobError("timed out waiting for preview services (" + std::to_string(elapsed) + "ms)");
  }

  const bool preview_ready = probe_->PreviewReady(*project);
  const bool runtime_ready = probe_->RuntimeReady(*project);
  if (preview_ready && runtime_ready) {
    projects_->SetStatus(project->id, ProjectStatus::kRunning);
    enqueuer_->EnqueueSessionCreate(project->id);
    SANDBOX_LOG_INFO("preview services ready", {StringField("project_id", project->id), IntField("elapsed_ms", static_cast<int64_t>(elapsed))});
    return;
  }

  SANDBOX_LOG_DEBUG("preview services not ready", {StringField("project_id", project->id), observability::BoolField("preview_ready", preview_ready),
                                                   observability::BoolField("runtime_ready", runtime_ready)});
  ctx.Reschedule(options_.wait_ready_poll_ms);
}

void ContainerJobHandlers::Stop(queue::JobContext& ctx) {
  const auto payload = queue::DecodePayload<v1::ContainerJobPayload>(ctx.PayloadJson());
  if (payload.project_id().empty()) {
    throw queue::PermanentJobError("docker.stop payload has no project id");
  }
  auto project = projects_->Get(payload.project_id());
  if (!project) return;

  ctx.ThrowIfCancelRequested();
  const bool deleting = project->status == ProjectStatus::kDeleting;
  if (!deleting) {
    projects_->SetStatus(project->id, ProjectStatus::kStopping);
  }

  try {
    runtime_->ComposeDown(*project);
  } catch (const std::exception&) {
    if (ctx.IsFinalAttempt() && !deleting) {
      projects_->SetStatus(project->id, ProjectStatus::kError);
    }
    throw;
  }

  if (!deleting) {
    projects_->SetStatus(project->id, ProjectStatus::kStopped);
  }
  SANDBOX_LOG_INFO("preview stopped", {StringField("project_id", project->id), StringField("reason", payload.reason())});
}

void ContainerJobHandlers::CreateSession(queue::JobContext& ctx) {
  const auto payload = queue::DecodePayload<v1::SessionJobPayload>(ctx.PayloadJson());
  auto       project = LoadTarget(ctx, payload.project_id());
  if (!project) return;

  if (project->status != ProjectStatus::kRunning) {
    SANDBOX_LOG_INFO("skipping session create for stopped preview", {StringField("project_id", project->id),
                                                                     StringField("status", sandbox::model::ToString(project->status))});
    return;
  }

  ctx.ThrowIfCancelRequested();
  sessions_->CreateSession(*project);
}

} // namespace sandbox::handlers
