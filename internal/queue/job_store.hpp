#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace sandbox::queue {

using db::model::JobRecord;

constexpr uint32_t    kMinConcurrency   = 1;
constexpr uint32_t    kMaxConcurrency   = 20;
constexpr uint64_t    kMaxBackoffMs     = 60000;
constexpr uint64_t    kBaseBackoffMs    = 2000;
constexpr std::size_t kMaxLastErrorSize = 500;

// min(60s, 2s * 2^(attempts-1))
uint64_t BackoffDelayMs(uint32_t attempts);

// Control characters become spaces; result is capped at kMaxLastErrorSize.
std::string SanitizeError(const std::string& message);

struct EnqueueOptions {
  int32_t                 priority = 0;
  std::string             dedupe_key;
  std::optional<uint64_t> run_at_ms;
  std::optional<uint32_t> max_attempts;
  std::string             project_id;
};

struct EnqueueResult {
  JobRecord job;
  bool      deduplicated = false;
};

/*
  Durable job table operations.

  Every mutation runs in one repository transaction and is a conditional
  update on the stored state, so concurrent dispatchers and admin calls
  cannot double-transition a job. Dispatcher-owned transitions are also
  guarded by the worker id holding the lease; a lost lease makes them a
  logged no-op.
*/
class JobStore {
 public:
  JobStore(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now, uint32_t default_max_attempts = 3);

  // Returns the active job holding dedupe_key instead of inserting a second one.
  EnqueueResult Enqueue(const std::string& type, const std::string& payload_json, const EnqueueOptions& options = {});

  std::optional<JobRecord> GetJobById(const std::string& id);
  std::vector<JobRecord>   ListJobs(const db::JobFilter& filter, const db::Pagination& page = {});
  uint64_t                 CountJobs(const db::JobFilter& filter);
  uint64_t                 CountRunning();

  // ------------------------------------------------------------------
  // Dispatcher side
  // ------------------------------------------------------------------

  /*
    Claims up to `max_jobs` runnable jobs for `worker_id`, bounded by the
    free concurrency slots. Nothing is claimed while paused. At most one
    job per project is claimed, and none for a project that already has a
    running job.
  */
  std::vector<JobRecord> ClaimJobs(const std::string& worker_id, uint64_t lease_ms, std::size_t max_jobs);

  bool RenewLease(const std::string& id, const std::string& worker_id, uint64_t lease_ms);

  void MarkSucceeded(const std::string& id, const std::string& worker_id);

  // attempts+1, then requeue with backoff or fail once attempts reach max.
  std::optional<JobRecord> MarkFailedAttempt(const std::string& id, const std::string& worker_id, const std::string& error);

  void MarkFailedPermanently(const std::string& id, const std::string& worker_id, const std::string& error);

  // Back to queued at now+delay without consuming an attempt.
  void Reschedule(const std::string& id, const std::string& worker_id, uint64_t delay_ms);

  void MarkCancelled(const std::string& id, const std::string& worker_id);

  bool IsCancelRequested(const std::string& id);

  // ------------------------------------------------------------------
  // Administrative
  // ------------------------------------------------------------------

  // queued -> cancelled; running -> cancel requested; terminal -> InvalidState.
  JobRecord Cancel(const std::string& id);

  // Only a running job whose lease has expired goes back to queued.
  JobRecord ForceUnlock(const std::string& id);

  // New queued job copying the terminal job's type, payload and routing.
  JobRecord Retry(const std::string& id);

  JobRecord RunNow(const std::string& id);

  void DeleteJob(const std::string& id);

  // InvalidArgument for non-terminal states.
  uint64_t DeleteJobsByState(sandbox::model::JobState state);

  db::model::QueueSettingsRecord GetSettings();
  db::model::QueueSettingsRecord SetConcurrency(uint32_t concurrency);
  db::model::QueueSettingsRecord SetPaused(bool paused);

  /*
    Cancels queued jobs of the given types for a project and requests
    cancellation of running ones. Returns how many jobs were touched.
  */
  std::size_t CancelJobsForProject(const std::string& project_id, const std::vector<std::string>& types);

 private:
  uint64_t NowMs() const;

  db::model::QueueSettingsRecord LoadSettings(db::Transaction& tx);

  // Loads a job owned by worker_id, or nullopt (logged) when the lease was lost.
  std::optional<JobRecord> LoadOwned(db::Transaction& tx, const std::string& id, const std::string& worker_id);

  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
  uint32_t                        default_max_attempts_;
};

} // namespace sandbox::queue
