#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "internal/queue/job_store.hpp"

namespace sandbox::queue {

// Fails the job without consuming its remaining attempts.
class PermanentJobError : public std::runtime_error {
 public:
  explicit PermanentJobError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Control-flow signals owned by the dispatcher. Handlers raise them
  through JobContext and must not catch them.
*/
class JobCancelled : public std::runtime_error {
 public:
  explicit JobCancelled(const std::string& job_id) : std::runtime_error("job cancelled: " + job_id) {
  }
};

class JobRescheduled : public std::runtime_error {
 public:
  explicit JobRescheduled(uint64_t delay_ms) : std::runtime_error("job rescheduled"), delay_ms_(delay_ms) {
  }

  uint64_t DelayMs() const {
    return delay_ms_;
  }

 private:
  uint64_t delay_ms_;
};

/*
  What a handler sees of the job it runs.
*/
class JobContext {
 public:
  JobContext(JobRecord job, JobStore& store, util::NowFn now);

  const JobRecord& Job() const {
    return job_;
  }
  const std::string& Id() const {
    return job_.id;
  }
  const std::string& Type() const {
    return job_.type;
  }
  const std::string& ProjectId() const {
    return job_.project_id;
  }
  const std::string& PayloadJson() const {
    return job_.payload_json;
  }

  uint64_t NowMs() const;

  // True when a failure of this run exhausts the job's attempts.
  bool IsFinalAttempt() const {
    return job_.attempts + 1 >= job_.max_attempts;
  }

  // Cancellation checkpoint; throws JobCancelled once a cancel was requested.
  void ThrowIfCancelRequested() const;

  // Ends this run and requeues the job at now+delay_ms.
  [[noreturn]] void Reschedule(uint64_t delay_ms) const;

 private:
  JobRecord   job_;
  JobStore&   store_;
  util::NowFn now_;
};

} // namespace sandbox::queue
