#include "job_enqueuer.hpp"

#include "internal/queue/payload_codec.hpp"
#include "sandbox/orchestrator/v1/job_payloads.pb.h"

namespace sandbox::queue {

namespace v1 = sandbox::orchestrator::v1;

std::string DedupeKeyFor(const std::string& type, const std::string& project_id) {
  if (type == job_types::kDockerStop) {
    return "stop:" + project_id;
  }
  return type + ":" + project_id;
}

JobEnqueuer::JobEnqueuer(std::shared_ptr<JobStore> store, util::NowFn now) : store_(std::move(store)), now_(std::move(now)) {
}

EnqueueResult JobEnqueuer::Submit(const char* type, const std::string& project_id, const std::string& payload_json, uint64_t delay_ms) {
  EnqueueOptions options;
  options.project_id = project_id;
  options.dedupe_key = DedupeKeyFor(type, project_id);
  if (delay_ms > 0) {
    options.run_at_ms = util::NowMillis(now_) + delay_ms;
  }
  return store_->Enqueue(type, payload_json, options);
}

EnqueueResult JobEnqueuer::EnqueueDockerStart(const std::string& project_id, const std::string& reason) {
  v1::ContainerJobPayload payload;
  payload.set_project_id(project_id);
  payload.set_reason(reason);
  payload.set_started_at_ms(util::NowMillis(now_));
  return Submit(job_types::kDockerComposeUp, project_id, EncodePayload(payload));
}

EnqueueResult JobEnqueuer::EnqueueDockerWaitReady(const std::string& project_id, uint64_t started_at_ms) {
  v1::ContainerJobPayload payload;
  payload.set_project_id(project_id);
  payload.set_started_at_ms(started_at_ms);
  return Submit(job_types::kDockerWaitReady, project_id, EncodePayload(payload));
}

EnqueueResult JobEnqueuer::EnqueueDockerStop(const std::string& project_id, const std::string& reason) {
  store_->CancelJobsForProject(project_id, {job_types::kDockerComposeUp, job_types::kDockerWaitReady});

  v1::ContainerJobPayload payload;
  payload.set_project_id(project_id);
  payload.set_reason(reason);
  payload.set_started_at_ms(util::NowMillis(now_));
  return Submit(job_types::kDockerStop, project_id, EncodePayload(payload));
}

EnqueueResult JobEnqueuer::EnqueueSessionCreate(const std::string& project_id) {
  v1::SessionJobPayload payload;
  payload.set_project_id(project_id);
  return Submit(job_types::kSessionCreate, project_id, EncodePayload(payload));
}

EnqueueResult JobEnqueuer::EnqueueProductionBuild(const std::string& project_id) {
  v1::ProductionJobPayload payload;
  payload.set_project_id(project_id);
  payload.set_started_at_ms(util::NowMillis(now_));
  return Submit(job_types::kProductionBuild, project_id, EncodePayload(payload));
}

EnqueueResult JobEnqueuer::EnqueueProductionStart(const std::string& project_id, const std::string& hash) {
  v1::ProductionJobPayload payload;
  payload.set_project_id(project_id);
  payload.set_production_hash(hash);
  payload.set_started_at_ms(util::NowMillis(now_));
  return Submit(job_types::kProductionStart, project_id, EncodePayload(payload));
}

EnqueueResult JobEnqueuer::EnqueueProductionWaitReady(const std::string& project_id, const std::string& hash,
                                                      const std::string& previous_hash, uint32_t port, uint64_t delay_ms) {
  v1::ProductionJobPayload payload;
  payload.set_project_id(project_id);
  payload.set_production_hash(hash);
  payload.set_previous_hash(previous_hash);
  payload.set_port(port);
  payload.set_started_at_ms(util::NowMillis(now_));
  return Submit(job_types::kProductionWaitReady, project_id, EncodePayload(payload), delay_ms);
}

EnqueueResult JobEnqueuer::EnqueueProductionStop(const std::string& project_id) {
  store_->CancelJobsForProject(project_id, {job_types::kProductionBuild, job_types::kProductionStart, job_types::kProductionWaitReady});

  v1::ProductionJobPayload payload;
  payload.set_project_id(project_id);
  return Submit(job_types::kProductionStop, project_id, EncodePayload(payload));
}

} // namespace sandbox::queue
