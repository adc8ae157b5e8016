#pragma once

#include <memory>
#include <string>

#include "internal/queue/job_store.hpp"

namespace sandbox::queue {

namespace job_types {

inline constexpr const char* kDockerComposeUp       = "docker.composeUp";
inline constexpr const char* kDockerWaitReady       = "docker.waitReady";
inline constexpr const char* kDockerStop            = "docker.stop";
inline constexpr const char* kSessionCreate         = "session.create";
inline constexpr const char* kProductionBuild       = "production.build";
inline constexpr const char* kProductionStart       = "production.start";
inline constexpr const char* kProductionWaitReady   = "production.waitReady";
inline constexpr const char* kProductionStop        = "production.stop";

} // namespace job_types

// `<type>:<projectId>`, except docker.stop which dedupes on `stop:<projectId>`.
std::string DedupeKeyFor(const std::string& type, const std::string& project_id);

/*
  Typed entry points onto the job store. Each one dedupes per project and
  job type, so repeating a request while a job is pending returns that
  job instead of queuing another.
*/
class JobEnqueuer {
 public:
  JobEnqueuer(std::shared_ptr<JobStore> store, util::NowFn now = util::Now);

  EnqueueResult EnqueueDockerStart(const std::string& project_id, const std::string& reason);
  EnqueueResult EnqueueDockerWaitReady(const std::string& project_id, uint64_t started_at_ms);

  // Also cancels pending start and wait-ready jobs for the project.
  EnqueueResult EnqueueDockerStop(const std::string& project_id, const std::string& reason);

  EnqueueResult EnqueueSessionCreate(const std::string& project_id);

  EnqueueResult EnqueueProductionBuild(const std::string& project_id);
  EnqueueResult EnqueueProductionStart(const std::string& project_id, const std::string& hash);
  EnqueueResult EnqueueProductionWaitReady(const std::string& project_id, const std::string& hash, const std::string& previous_hash,
                                           uint32_t port, uint64_t delay_ms);
  EnqueueResult EnqueueProductionStop(const std::string& project_id);

  JobStore& Store() {
    return *store_;
  }

 private:
  EnqueueResult Submit(const char* type, const std::string& project_id, const std::string& payload_json, uint64_t delay_ms = 0);

  std::shared_ptr<JobStore> store_;
  util::NowFn               now_;
};

} // namespace sandbox::queue
