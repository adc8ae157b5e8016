#include "job_store.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace sandbox::queue {

using db::ErrorCode;
using observability::IntField;
using observability::StringField;
using sandbox::model::JobState;

namespace {

constexpr std::size_t kClaimCandidateFactor = 4;

// Terminal transitions release the dedupe slot and the lease.
void Finish(JobRecord& job, JobState state, uint64_t now_ms) {
  job.state         = state;
  job.dedupe_active = false;
  job.ClearLock();
  job.updated_at_ms = now_ms;
}

JobRecord RequireJob(db::Repository& repo, db::Transaction& tx, const std::string& id) {
  auto job = repo.GetJob(tx, id);
  if (!job) {
    throw util::NotFound("job not found: " + id);
  }
  return *job;
}

} // namespace

uint64_t BackoffDelayMs(uint32_t attempts) {
  if (attempts <= 1) return kBaseBackoffMs;
  const uint32_t shift = std::min<uint32_t>(attempts - 1, 16);
  return std::min<uint64_t>(kMaxBackoffMs, kBaseBackoffMs << shift);
}

std::string SanitizeError(const std::string& message) {
  std::string out;
  out.reserve(std::min(message.size(), kMaxLastErrorSize));
  for (char c : message) {
    if (out.size() == kMaxLastErrorSize) break;
    const auto uc = static_cast<unsigned char>(c);
    out.push_back(uc < 0x20 || uc == 0x7f ? ' ' : c);
  }
  return out;
}

JobStore::JobStore(std::shared_ptr<db::Repository> repository, util::NowFn now, uint32_t default_max_attempts)
    : repository_(std::move(repository)), now_(std::move(now)), default_max_attempts_(default_max_attempts == 0 ? 3 : default_max_attempts) {
}

uint64_t JobStore::NowMs() const {
  return util::NowMillis(now_);
}

EnqueueResult JobStore::Enqueue(const std::string& type, const std::string& payload_json, const EnqueueOptions& options) {
  if (type.empty()) {
    throw util::InvalidArgument("job type is required");
  }

  const auto now_ms = NowMs();

  JobRecord job;
  job.id            = util::NewId();
  job.type          = type;
  job.state         = JobState::kQueued;
  job.project_id    = options.project_id;
  job.payload_json  = payload_json.empty() ? "{}" : payload_json;
  job.priority      = options.priority;
  job.max_attempts  = options.max_attempts.value_or(default_max_attempts_);
  job.run_at_ms     = options.run_at_ms.value_or(now_ms);
  job.dedupe_key    = options.dedupe_key;
  job.dedupe_active = !options.dedupe_key.empty();
  job.created_at_ms = now_ms;
  job.updated_at_ms = now_ms;

  auto tx = repository_->Begin();

  if (!job.dedupe_key.empty()) {
    if (auto existing = repository_->FindActiveJobByDedupeKey(*tx, job.dedupe_key)) {
      tx->Commit();
      SANDBOX_LOG_DEBUG("job enqueue deduplicated", {StringField("job_id", existing->id), StringField("dedupe_key", job.dedupe_key)});
      return {*existing, true};
    }
  }

  auto result = repository_->InsertJob(*tx, job);
  if (!result && result.code == ErrorCode::ConstraintViolation && !job.dedupe_key.empty()) {
    if (auto existing = repository_->FindActiveJobByDedupeKey(*tx, job.dedupe_key)) {
      tx->Commit();
      return {*existing, true};
    }
  }
  db::ThrowIfDbError(result, "insert job");
  tx->Commit();

  SANDBOX_LOG_INFO("job enqueued", {StringField("job_id", job.id), StringField("type", job.type), StringField("project_id", job.project_id),
                                    IntField("run_at_ms", static_cast<int64_t>(job.run_at_ms))});
  return {job, false};
}

std::optional<JobRecord> JobStore::GetJobById(const std::string& id) {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, id);
  tx->Commit();
  return job;
}

std::vector<JobRecord> JobStore::ListJobs(const db::JobFilter& filter, const db::Pagination& page) {
  auto tx   = repository_->Begin();
  auto jobs = repository_->ListJobs(*tx, filter, page);
  tx->Commit();
  return jobs;
}

uint64_t JobStore::CountJobs(const db::JobFilter& filter) {
  auto tx    = repository_->Begin();
  auto count = repository_->CountJobs(*tx, filter);
  tx->Commit();
  return count;
}

uint64_t JobStore::CountRunning() {
  db::JobFilter filter;
  filter.state = JobState::kRunning;
  return CountJobs(filter);
}

db::model::QueueSettingsRecord JobStore::LoadSettings(db::Transaction& tx) {
  return repository_->GetQueueSettings(tx).value_or(db::model::QueueSettingsRecord{});
}

std::vector<JobRecord> JobStore::ClaimJobs(const std::string& worker_id, uint64_t lease_ms, std::size_t max_jobs) {
  std::vector<JobRecord> claimed;
  if (max_jobs == 0) return claimed;

  const auto now_ms = NowMs();
  auto       tx     = repository_->Begin();

  const auto settings = LoadSettings(*tx);
  if (settings.paused) {
    tx->Commit();
    return claimed;
  }

  db::JobFilter running_filter;
  running_filter.state = JobState::kRunning;
  const auto running   = repository_->CountJobs(*tx, running_filter);
  if (running >= settings.concurrency) {
    tx->Commit();
    return claimed;
  }

  const auto slots      = std::min<std::size_t>(max_jobs, settings.concurrency - running);
  auto       candidates = repository_->ListRunnableJobs(*tx, now_ms, slots * kClaimCandidateFactor);

  std::unordered_set<std::string> projects;
  for (auto& job : candidates) {
    if (claimed.size() == slots) break;
    if (!job.project_id.empty() && !projects.insert(job.project_id).second) continue;

    JobRecord next          = job;
    next.state              = JobState::kRunning;
    next.locked_at_ms       = now_ms;
    next.lock_expires_at_ms = now_ms + lease_ms;
    next.locked_by          = worker_id;
    next.updated_at_ms      = now_ms;

    auto result = repository_->UpdateJobIf(*tx, next, JobState::kQueued, "");
    if (!result) {
      if (result.code == ErrorCode::Conflict || result.code == ErrorCode::NotFound) continue;
      db::ThrowIfDbError(result, "claim job");
    }
    claimed.push_back(std::move(next));
  }

  tx->Commit();

  for (const auto& job : claimed) {
    SANDBOX_LOG_INFO("job claimed", {StringField("job_id", job.id), StringField("type", job.type), StringField("worker_id", worker_id)});
  }
  return claimed;
}

std::optional<JobRecord> JobStore::LoadOwned(db::Transaction& tx, const std::string& id, const std::string& worker_id) {
  auto job = repository_->GetJob(tx, id);
  if (!job || job->state != JobState::kRunning || job->locked_by != worker_id) {
    SANDBOX_LOG_WARN("job lease lost", {StringField("job_id", id), StringField("worker_id", worker_id)});
    return std::nullopt;
  }
  return job;
}

bool JobStore::RenewLease(const std::string& id, const std::string& worker_id, uint64_t lease_ms) {
  const auto now_ms = NowMs();
  auto       tx     = repository_->Begin();
  auto       job    = LoadOwned(*tx, id, worker_id);
  if (!job) return false;

  job->lock_expires_at_ms = now_ms + lease_ms;
  job->updated_at_ms      = now_ms;
  auto result             = repository_->UpdateJobIf(*tx, *job, JobState::kRunning, worker_id);
  if (!result) return false;
  tx->Commit();
  return true;
}

void JobStore::MarkSucceeded(const std::string& id, const std::string& worker_id) {
  auto tx  = repository_->Begin();
  auto job = LoadOwned(*tx, id, worker_id);
  if (!job) return;

  Finish(*job, JobState::kSucceeded, NowMs());
  db::ThrowIfDbError(repository_->UpdateJobIf(*tx, *job, JobState::kRunning, worker_id), "complete job");
  tx->Commit();

  SANDBOX_LOG_INFO("job succeeded", {StringField("job_id", id), StringField("type", job->type)});
}

std::optional<JobRecord> JobStore::MarkFailedAttempt(const std::string& id, const std::string& worker_id, const std::string& error) {
  const auto now_ms = NowMs();
  auto       tx     = repository_->Begin();
  auto       job    = LoadOwned(*tx, id, worker_id);
  if (!job) return std::nullopt;

  job->attempts += 1;
  job->last_error = SanitizeError(error);

  if (job->attempts < job->max_attempts) {
    const auto delay = BackoffDelayMs(job->attempts);
    job->state       = JobState::kQueued;
    job->run_at_ms   = now_ms + delay;
    job->ClearLock();
    job->updated_at_ms = now_ms;
    db::ThrowIfDbError(repository_->UpdateJobIf(*tx, *job, JobState::kRunning, worker_id), "retry job");
    tx->Commit();

    SANDBOX_LOG_WARN("job retry scheduled", {StringField("job_id", id), StringField("type", job->type),
                                             IntField("attempts", job->attempts), IntField("delay_ms", static_cast<int64_t>(delay)),
                                             StringField("error", job->last_error)});
    return job;
  }

  Finish(*job, JobState::kFailed, now_ms);
  db::ThrowIfDbError(repository_->UpdateJobIf(*tx, *job, JobState::kRunning, worker_id), "fail job");
  tx->Commit();

  SANDBOX_LOG_ERROR("job failed", {StringField("job_id", id), StringField("type", job->type), IntField("attempts", job->attempts),
                                   StringField("error", job->last_error)});
  return job;
}

void JobStore::MarkFailedPermanently(const std::string& id, const std::string& worker_id, const std::string& error) {
  auto tx  = repository_->Begin();
  auto job = LoadOwned(*tx, id, worker_id);
  if (!job) return;

  job->attempts += 1;
  job->last_error = SanitizeError(error);
  Finish(*job, JobState::kFailed, NowMs());
  db::ThrowIfDbError(repository_->UpdateJobIf(*tx, *job, JobState::kRunning, worker_id), "fail job");
  tx->Commit();

  SANDBOX_LOG_ERROR("job failed permanently", {StringField("job_id", id), StringField("type", job->type), StringField("error", job->last_error)});
}

void JobStore::Reschedule(const std::string& id, const std::string& worker_id, uint64_t delay_ms) {
  const auto now_ms = NowMs();
  auto       tx     = repository_->Begin();
  auto       job    = LoadOwned(*tx, id, worker_id);
  if (!job) return;

  job->state     = JobState::kQueued;
  job->run_at_ms = now_ms + delay_ms;
  job->ClearLock();
  job->updated_at_ms = now_ms;
  db::ThrowIfDbError(repository_->UpdateJobIf(*tx, *job, JobState::kRunning, worker_id), "reschedule job");
  tx->Commit();

  SANDBOX_LOG_DEBUG("job rescheduled", {StringField("job_id", id), IntField("delay_ms", static_cast<int64_t>(delay_ms))});
}

void JobStore::MarkCancelled(const std::string& id, const std::string& worker_id) {
  const auto now_ms = NowMs();
  auto       tx     = repository_->Begin();
  auto       job    = LoadOwned(*tx, id, worker_id);
  if (!job) return;

  Finish(*job, JobState::kCancelled, now_ms);
  job->cancelled_at_ms = now_ms;
  db::ThrowIfDbError(repository_->UpdateJobIf(*tx, *job, JobState::kRunning, worker_id), "cancel job");
  tx->Commit();

  SANDBOX_LOG_INFO("job cancelled", {StringField("job_id", id), StringField("type", job->type)});
}

bool JobStore::IsCancelRequested(const std::string& id) {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, id);
  tx->Commit();
  return job && job->cancel_requested_at_ms.has_value();
}

JobRecord JobStore::Cancel(const std::string& id) {
  const auto now_ms = NowMs();
  auto       tx     = repository_->Begin();
  auto       job    = RequireJob(*repository_, *tx, id);
  const auto prior  = job.state;

  if (sandbox::model::IsTerminal(prior)) {
    throw util::InvalidState("job " + id + " is already " + std::string(sandbox::model::ToString(prior)));
  }

  if (prior == JobState::kQueued) {
    Finish(job, JobState::kCancelled, now_ms);
    job.cancelled_at_ms        = now_ms;
    job.cancel_requested_at_ms = now_ms;
  } else {
    job.cancel_requested_at_ms = now_ms;
    job.updated_at_ms          = now_ms;
  }

  db::ThrowIfDbError(repository_->UpdateJobIf(*tx, job, prior, ""), "cancel job");
  tx->Commit();

  SANDBOX_LOG_INFO(prior == JobState::kQueued ? "job cancelled" : "job cancel requested", {StringField("job_id", id)});
  return job;
}

JobRecord JobStore::ForceUnlock(const std::string& id) {
  const auto now_ms = NowMs();
  auto       tx     = repository_->Begin();
  auto       job    = RequireJob(*repository_, *tx, id);

  if (job.state != JobState::kRunning || !job.lock_expires_at_ms || *job.lock_expires_at_ms >= now_ms) {
    throw util::InvalidState("job " + id + " is not locked past its lease");
  }

  const auto previous_owner = job.locked_by;
  job.state                 = JobState::kQueued;
  job.run_at_ms             = now_ms;
  job.ClearLock();
  job.updated_at_ms = now_ms;
  db::ThrowIfDbError(repository_->UpdateJobIf(*tx, job, JobState::kRunning, previous_owner), "force unlock job");
  tx->Commit();

  SANDBOX_LOG_WARN("job force-unlocked", {StringField("job_id", id), StringField("previous_owner", previous_owner)});
  return job;
}

JobRecord JobStore::Retry(const std::string& id) {
  auto source = GetJobById(id);
  if (!source) {
    throw util::NotFound("job not found: " + id);
  }
  if (!sandbox::model::IsTerminal(source->state)) {
    throw util::InvalidState("job " + id + " is still " + std::string(sandbox::model::ToString(source->state)));
  }

  EnqueueOptions options;
  options.priority     = source->priority;
  options.max_attempts = source->max_attempts;
  options.project_id   = source->project_id;
  options.dedupe_key   = source->dedupe_key;

  auto result = Enqueue(source->type, source->payload_json, options);
  SANDBOX_LOG_INFO("job retried", {StringField("job_id", id), StringField("new_job_id", result.job.id)});
  return result.job;
}

JobRecord JobStore::RunNow(const std::string& id) {
  const auto now_ms = NowMs();
  auto       tx     = repository_->Begin();
  auto       job    = RequireJob(*repository_, *tx, id);

  if (job.state != JobState::kQueued) {
    throw util::InvalidState("job " + id + " is not queued");
  }

  job.run_at_ms     = 0;
  job.updated_at_ms = now_ms;
  db::ThrowIfDbError(repository_->UpdateJobIf(*tx, job, JobState::kQueued, ""), "run job now");
  tx->Commit();
  return job;
}

void JobStore::DeleteJob(const std::string& id) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteJob(*tx, id), "delete job " + id);
  tx->Commit();
}

uint64_t JobStore::DeleteJobsByState(JobState state) {
  if (!sandbox::model::IsTerminal(state)) {
    throw util::InvalidArgument("cannot delete jobs in state " + std::string(sandbox::model::ToString(state)));
  }

  auto tx      = repository_->Begin();
  auto deleted = repository_->DeleteJobsInState(*tx, state);
  tx->Commit();

  SANDBOX_LOG_INFO("jobs deleted", {StringField("state", sandbox::model::ToString(state)), IntField("count", static_cast<int64_t>(deleted))});
  return deleted;
}

db::model::QueueSettingsRecord JobStore::GetSettings() {
  auto tx       = repository_->Begin();
  auto settings = LoadSettings(*tx);
  tx->Commit();
  return settings;
}

db::model::QueueSettingsRecord JobStore::SetConcurrency(uint32_t concurrency) {
  if (concurrency < kMinConcurrency || concurrency > kMaxConcurrency) {
    throw util::InvalidArgument("concurrency must be between 1 and 20");
  }

  auto tx             = repository_->Begin();
  auto settings       = LoadSettings(*tx);
  settings.concurrency = concurrency;
  db::ThrowIfDbError(repository_->SaveQueueSettings(*tx, settings), "save queue settings");
  tx->Commit();

  SANDBOX_LOG_INFO("queue concurrency set", {IntField("concurrency", concurrency)});
  return settings;
}

db::model::QueueSettingsRecord JobStore::SetPaused(bool paused) {
  auto tx         = repository_->Begin();
  auto settings   = LoadSettings(*tx);
  settings.paused = paused;
  db::ThrowIfDbError(repository_->SaveQueueSettings(*tx, settings), "save queue settings");
  tx->Commit();

  SANDBOX_LOG_INFO(paused ? "queue paused" : "queue resumed");
  return settings;
}

std::size_t JobStore::CancelJobsForProject(const std::string& project_id, const std::vector<std::string>& types) {
  const auto now_ms = NowMs();
  auto       tx     = repository_->Begin();

  db::JobFilter filter;
  filter.project_id = project_id;
  db::Pagination all;
  all.limit = 0;

  std::size_t touched = 0;
  for (auto job : repository_->ListJobs(*tx, filter, all)) {
    if (std::find(types.begin(), types.end(), job.type) == types.end()) continue;

    const auto prior = job.state;
    if (prior == JobState::kQueued) {
      Finish(job, JobState::kCancelled, now_ms);
      job.cancelled_at_ms        = now_ms;
      job.cancel_requested_at_ms = now_ms;
    } else if (prior == JobState::kRunning && !job.cancel_requested_at_ms) {
      job.cancel_requested_at_ms = now_ms;
      job.updated_at_ms          = now_ms;
    } else {
      continue;
    }

    auto result = repository_->UpdateJobIf(*tx, job, prior, "");
    if (!result) {
      if (result.code == ErrorCode::Conflict) continue;
      db::ThrowIfDbError(result, "cancel project job");
    }
    ++touched;
  }
  tx->Commit();

  if (touched > 0) {
    SANDBOX_LOG_INFO("project jobs cancelled", {StringField("project_id", project_id), IntField("count", static_cast<int64_t>(touched))});
  }
  return touched;
}

} // namespace sandbox::queue
