#include "proto_mapping.hpp"

namespace sandbox::service {

using sandbox::model::JobState;
using sandbox::model::ProductionStatus;
using sandbox::model::ProjectStatus;

v1::JobState ToProto(JobState state) {
  switch (state) {
    case JobState::kQueued:
      return v1::JOB_STATE_QUEUED;
    case JobState::kRunning:
      return v1::JOB_STATE_RUNNING;
    case JobState::kSucceeded:
      return v1::JOB_STATE_SUCCEEDED;
    case JobState::kFailed:
      return v1::JOB_STATE_FAILED;
    case JobState::kCancelled:
      return v1::JOB_STATE_CANCELLED;
  }
  return v1::JOB_STATE_UNSPECIFIED;
}

v1::ProjectStatus ToProto(ProjectStatus status) {
  switch (status) {
    case ProjectStatus::kCreated:
      return v1::PROJECT_STATUS_CREATED;
    case ProjectStatus::kStarting:
      return v1::PROJECT_STATUS_STARTING;
    case ProjectStatus::kRunning:
      return v1::PROJECT_STATUS_RUNNING;
    case ProjectStatus::kStopping:
      return v1::PROJECT_STATUS_STOPPING;
    case ProjectStatus::kStopped:
      return v1::PROJECT_STATUS_STOPPED;
    case ProjectStatus::kError:
      return v1::PROJECT_STATUS_ERROR;
    case ProjectStatus::kDeleting:
      return v1::PROJECT_STATUS_DELETING;
  }
  return v1::PROJECT_STATUS_UNSPECIFIED;
}

v1::ProductionStatus ToProto(ProductionStatus status) {
  switch (status) {
    case ProductionStatus::kStopped:
      return v1::PRODUCTION_STATUS_STOPPED;
    case ProductionStatus::kQueued:
      return v1::PRODUCTION_STATUS_QUEUED;
    case ProductionStatus::kBuilding:
      return v1::PRODUCTION_STATUS_BUILDING;
    case ProductionStatus::kRunning:
      return v1::PRODUCTION_STATUS_RUNNING;
    case ProductionStatus::kFailed:
      return v1::PRODUCTION_STATUS_FAILED;
  }
  return v1::PRODUCTION_STATUS_UNSPECIFIED;
}

std::optional<JobState> FromProto(v1::JobState state) {
  switch (state) {
    case v1::JOB_STATE_QUEUED:
      return JobState::kQueued;
    case v1::JOB_STATE_RUNNING:
      return JobState::kRunning;
    case v1::JOB_STATE_SUCCEEDED:
      return JobState::kSucceeded;
    case v1::JOB_STATE_FAILED:
      return JobState::kFailed;
    case v1::JOB_STATE_CANCELLED:
      return JobState::kCancelled;
    default:
      return std::nullopt;
  }
}

v1::Job ToProto(const db::model::JobRecord& job) {
  v1::Job out;
  out.set_id(job.id);
  out.set_type(job.type);
  out.set_state(ToProto(job.state));
  out.set_project_id(job.project_id);
  out.set_payload_json(job.payload_json);
  out.set_priority(job.priority);
  out.set_attempts(job.attempts);
  out.set_max_attempts(job.max_attempts);
  out.set_run_at_ms(job.run_at_ms);
  out.set_locked_at_ms(job.locked_at_ms.value_or(0));
  out.set_lock_expires_at_ms(job.lock_expires_at_ms.value_or(0));
  out.set_locked_by(job.locked_by);
  out.set_dedupe_key(job.dedupe_key);
  out.set_dedupe_active(job.dedupe_active);
  out.set_cancel_requested_at_ms(job.cancel_requested_at_ms.value_or(0));
  out.set_cancelled_at_ms(job.cancelled_at_ms.value_or(0));
  out.set_last_error(job.last_error);
  out.set_created_at_ms(job.created_at_ms);
  out.set_updated_at_ms(job.updated_at_ms);
  return out;
}

v1::Project ToProto(const db::model::ProjectRecord& project) {
  v1::Project out;
  out.set_id(project.id);
  out.set_name(project.name);
  out.set_path_on_disk(project.path_on_disk);
  out.set_status(ToProto(project.status));
  out.set_dev_port(project.dev_port);
  out.set_runtime_port(project.runtime_port);
  out.set_production_status(ToProto(project.production_status));
  out.set_production_hash(project.production_hash);
  out.set_production_port(project.production_port);
  out.set_production_url(project.production_url);
  out.set_production_error(project.production_error);
  out.set_production_started_at_ms(project.production_started_at_ms);
  out.set_created_at_ms(project.created_at_ms);
  out.set_updated_at_ms(project.updated_at_ms);
  return out;
}

v1::QueueSettings ToProto(const db::model::QueueSettingsRecord& settings) {
  v1::QueueSettings out;
  out.set_paused(settings.paused);
  out.set_concurrency(settings.concurrency);
  return out;
}

v1::ReleaseVersion ToProto(const production::ReleaseVersion& version) {
  v1::ReleaseVersion out;
  out.set_hash(version.hash);
  out.set_is_active(version.is_active);
  out.set_mtime_ms(version.mtime_ms);
  return out;
}

db::JobFilter FromProto(const v1::JobFilter& filter) {
  db::JobFilter out;
  out.state      = FromProto(filter.state());
  out.type       = filter.type();
  out.project_id = filter.project_id();
  out.text       = filter.text();
  return out;
}

} // namespace sandbox::service
