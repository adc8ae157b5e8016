#include "production_handlers.hpp"

#include "internal/observability/logging.hpp"
#include "internal/queue/payload_codec.hpp"
#include "internal/util/errors.hpp"
#include "sandbox/orchestrator/v1/job_payloads.pb.h"

namespace sandbox::handlers {

namespace v1 = sandbox::orchestrator::v1;

using observability::StringField;

namespace {

v1::ProductionJobPayload DecodeProductionPayload(const queue::JobContext& ctx) {
  auto payload = queue::DecodePayload<v1::ProductionJobPayload>(ctx.PayloadJson());
  if (payload.project_id().empty()) {
    throw queue::PermanentJobError(ctx.Type() + " payload has no project id");
  }
  return payload;
}

} // namespace

ProductionJobHandlers::ProductionJobHandlers(std::shared_ptr<production::ProductionService> production)
    : production_(std::move(production)) {
}

void ProductionJobHandlers::Register(const std::shared_ptr<ProductionJobHandlers>& self, queue::HandlerRegistry& registry) {
  registry.Register(queue::job_types::kProductionBuild, [self](queue::JobContext& ctx) { self->Build(ctx); });
  registry.Register(queue::job_types::kProductionStart, [self](queue::JobContext& ctx) { self->Start(ctx); });
  registry.Register(queue::job_types::kProductionWaitReady, [self](queue::JobContext& ctx) { self->WaitReady(ctx); });
  registry.Register(queue::job_types::kProductionStop, [self](queue::JobContext& ctx) { self->Stop(ctx); });
}

void ProductionJobHandlers::FailIfTracked(const std::string& project_id, const std::string& error) {
  try {
    production_->FailDeployment(project_id, "", "", error);
  } catch (const util::NotFound&) {
    SANDBOX_LOG_WARN("project not found for production job", {StringField("project_id", project_id)});
  }
}

void ProductionJobHandlers::Build(queue::JobContext& ctx) {
  const auto payload = DecodeProductionPayload(ctx);
  ctx.ThrowIfCancelRequested();

  try {
    const auto hash = production_->BuildRelease(payload.project_id());
    SANDBOX_LOG_INFO("production build job done", {StringField("project_id", payload.project_id()), StringField("hash", hash)});
  } catch (const util::NotFound& e) {
    throw queue::PermanentJobError(e.what());
  } catch (const util::InvalidState& e) {
    throw queue::PermanentJobError(e.what());
  } catch (const std::exception& e) {
    if (ctx.IsFinalAttempt()) {
      production_->FailDeployment(payload.project_id(), "", "", std::string("build failed: ") + e.what());
    }
    throw;
  }
}

void ProductionJobHandlers::Start(queue::JobContext& ctx) {
  const auto payload = DecodeProductionPayload(ctx);
  if (payload.production_hash().empty()) {
    throw queue::PermanentJobError("production.start payload has no hash");
  }
  ctx.ThrowIfCancelRequested();

  try {
    production_->StartRelease(payload.project_id(), payload.production_hash());
  } catch (const util::NotFound& e) {
    FailIfTracked(payload.project_id(), e.what());
    throw queue::PermanentJobError(e.what());
  } catch (const util::InvalidState& e) {
    throw queue::PermanentJobError(e.what());
  } catch (const std::exception& e) {
    if (ctx.IsFinalAttempt()) {
      production_->FailDeployment(payload.project_id(), payload.production_hash(), "", std::string("start failed: ") + e.what());
    }
    throw;
  }
}

void ProductionJobHandlers::WaitReady(queue::JobContext& ctx) {
  const auto payload = DecodeProductionPayload(ctx);
  ctx.ThrowIfCancelRequested();

  production::ReadyCheck check = production::ReadyCheck::kPending;
  try {
    check = production_->CheckReady(payload.project_id(), payload.production_hash(), payload.previous_hash(), payload.port(),
                                    payload.started_at_ms());
  } catch (const util::NotFound& e) {
    throw queue::PermanentJobError(e.what());
  } catch (const std::exception& e) {
    if (ctx.IsFinalAttempt()) {
      production_->FailDeployment(payload.project_id(), payload.production_hash(), payload.previous_hash(),
                                  std::string("readiness check failed: ") + e.what());
    }
    throw;
  }

  switch (check) {
    case production::ReadyCheck::kReady:
    case production::ReadyCheck::kSuperseded:
      return;
    case production::ReadyCheck::kTimedOut:
      throw queue::PermanentJobError("production not ready within " + std::to_string(production_->Options().ready_timeout_ms) + "ms");
    case production::ReadyCheck::kPending:
      break;
  }
  ctx.Reschedule(production_->Options().ready_probe_interval_ms);
}

void ProductionJobHandlers::Stop(queue::JobContext& ctx) {
  const auto payload = DecodeProductionPayload(ctx);
  ctx.ThrowIfCancelRequested();

  try {
    production_->Teardown(payload.project_id());
  } catch (const util::NotFound& e) {
    SANDBOX_LOG_WARN("project not found for production stop", {StringField("project_id", payload.project_id()), StringField("error", e.what())});
  } catch (const util::InvalidState& e) {
    throw queue::PermanentJobError(e.what());
  }
}

} // namespace sandbox::handlers
