#pragma once

#include "sandbox/orchestrator/v1.hpp"
#include "service_context.hpp"

namespace sandbox::service {

class QueueService {
public:
  explicit QueueService(ServiceContext ctx);

  sandbox::orchestrator::v1::ListJobsResponse ListJobs(const sandbox::orchestrator::v1::ListJobsRequest& req);

  sandbox::orchestrator::v1::CountJobsResponse CountJobs(const sandbox::orchestrator::v1::CountJobsRequest& req);

  sandbox::orchestrator::v1::Job GetJob(const sandbox::orchestrator::v1::GetJobRequest& req);

  // One WatchJobs frame: the filtered page plus queue settings and running count.
  sandbox::orchestrator::v1::JobsSnapshot Snapshot(const sandbox::orchestrator::v1::WatchJobsRequest& req, uint64_t sequence);

  sandbox::orchestrator::v1::QueueSettings GetSettings(const sandbox::orchestrator::v1::GetSettingsRequest& req);

  sandbox::orchestrator::v1::Job Cancel(const sandbox::orchestrator::v1::JobIdRequest& req);
  sandbox::orchestrator::v1::Job Retry(const sandbox::orchestrator::v1::JobIdRequest& req);
  sandbox::orchestrator::v1::Job RunNow(const sandbox::orchestrator::v1::JobIdRequest& req);
  sandbox::orchestrator::v1::Job ForceUnlock(const sandbox::orchestrator::v1::JobIdRequest& req);

  void Delete(const sandbox::orchestrator::v1::JobIdRequest& req);

  sandbox::orchestrator::v1::DeleteJobsByStateResponse
  DeleteByState(const sandbox::orchestrator::v1::DeleteJobsByStateRequest& req);

  sandbox::orchestrator::v1::QueueSettings SetConcurrency(const sandbox::orchestrator::v1::SetConcurrencyRequest& req);

  sandbox::orchestrator::v1::QueueSettings SetPaused(const sandbox::orchestrator::v1::SetPausedRequest& req);

private:
  ServiceContext ctx_;
};

}
