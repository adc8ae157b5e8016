#include "queue_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/queue/job_store.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace sandbox::service {

using namespace sandbox::orchestrator::v1;

namespace {

constexpr uint32_t kDefaultPageSize = 100;

db::Pagination ToPage(uint32_t limit, uint32_t offset) {
  db::Pagination page;
  page.limit  = limit == 0 ? kDefaultPageSize : limit;
  page.offset = offset;
  return page;
}

void RequireId(const std::string& id) {
  if (id.empty()) {
    throw util::InvalidArgument("job id is required");
  }
}

} // namespace

QueueService::QueueService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListJobsResponse QueueService::ListJobs(const ListJobsRequest& req) {
  return ObserveRpc("QueueService.ListJobs", req.filter().project_id(), [&] {
    const auto filter = FromProto(req.filter());
    const auto page   = ToPage(req.limit(), req.offset());

    ListJobsResponse resp;
    for (const auto& job : ctx_.jobs->ListJobs(filter, page)) {
      *resp.add_jobs() = ToProto(job);
    }
    resp.set_total(ctx_.jobs->CountJobs(filter));
    resp.set_limit(static_cast<uint32_t>(page.limit));
    resp.set_offset(static_cast<uint32_t>(page.offset));
    return resp;
  });
}

CountJobsResponse QueueService::CountJobs(const CountJobsRequest& req) {
  return ObserveRpc("QueueService.CountJobs", req.filter().project_id(), [&] {
    CountJobsResponse resp;
    resp.set_count(ctx_.jobs->CountJobs(FromProto(req.filter())));
    return resp;
  });
}

Job QueueService::GetJob(const GetJobRequest& req) {
  return ObserveRpc("QueueService.GetJob", req.id(), [&] {
    RequireId(req.id());
    auto job = ctx_.jobs->GetJobById(req.id());
    if (!job) {
      throw util::NotFound("job not found: " + req.id());
    }
    return ToProto(*job);
  });
}

JobsSnapshot QueueService::Snapshot(const WatchJobsRequest& req, uint64_t sequence) {
  const auto filter   = FromProto(req.filter());
  const auto page     = ToPage(req.limit(), req.offset());
  const auto settings = ctx_.jobs->GetSettings();

  JobsSnapshot snapshot;
  for (const auto& job : ctx_.jobs->ListJobs(filter, page)) {
    *snapshot.add_jobs() = ToProto(job);
  }
  snapshot.set_total(ctx_.jobs->CountJobs(filter));
  snapshot.set_limit(static_cast<uint32_t>(page.limit));
  snapshot.set_offset(static_cast<uint32_t>(page.offset));
  snapshot.set_paused(settings.paused);
  snapshot.set_concurrency(settings.concurrency);
  snapshot.set_running(ctx_.jobs->CountRunning());
  snapshot.set_sequence(sequence);
  return snapshot;
}

QueueSettings QueueService::GetSettings(const GetSettingsRequest&) {
  return ObserveRpc("QueueService.GetSettings", {}, [&] { return ToProto(ctx_.jobs->GetSettings()); });
}

Job QueueService::Cancel(const JobIdRequest& req) {
  return ObserveRpc("QueueService.CancelJob", req.id(), [&] {
    RequireId(req.id());
    auto job = ctx_.jobs->Cancel(req.id());
    SANDBOX_LOG_INFO("Job cancel requested",
                     {observability::StringField("job_id", job.id), observability::StringField("state", sandbox::model::ToString(job.state))});
    return ToProto(job);
  });
}

Job QueueService::Retry(const JobIdRequest& req) {
  return ObserveRpc("QueueService.RetryJob", req.id(), [&] {
    RequireId(req.id());
    auto job = ctx_.jobs->Retry(req.id());
    SANDBOX_LOG_INFO("Job retried", {observability::StringField("source_job_id", req.id()), observability::StringField("job_id", job.id)});
    return ToProto(job);
  });
}

Job QueueService::RunNow(const JobIdRequest& req) {
  return ObserveRpc("QueueService.RunJobNow", req.id(), [&] {
    RequireId(req.id());
    return ToProto(ctx_.jobs->RunNow(req.id()));
  });
}

Job QueueService::ForceUnlock(const JobIdRequest& req) {
  return ObserveRpc("QueueService.ForceUnlockJob", req.id(), [&] {
    RequireId(req.id());
    auto job = ctx_.jobs->ForceUnlock(req.id());
    SANDBOX_LOG_WARN("Job lease force-unlocked", {observability::StringField("job_id", job.id)});
    return ToProto(job);
  });
}

void QueueService::Delete(const JobIdRequest& req) {
  ObserveRpc("QueueService.DeleteJob", req.id(), [&] {
    RequireId(req.id());
    ctx_.jobs->DeleteJob(req.id());
  });
}

DeleteJobsByStateResponse QueueService::DeleteByState(const DeleteJobsByStateRequest& req) {
  return ObserveRpc("QueueService.DeleteJobsByState", {}, [&] {
    const auto state = FromProto(req.state());
    if (!state) {
      throw util::InvalidArgument("state is required");
    }
    DeleteJobsByStateResponse resp;
    resp.set_deleted(ctx_.jobs->DeleteJobsByState(*state));
    SANDBOX_LOG_INFO("Jobs deleted by state", {observability::StringField("state", sandbox::model::ToString(*state)),
                                               observability::IntField("deleted", static_cast<int64_t>(resp.deleted()))});
    return resp;
  });
}

QueueSettings QueueService::SetConcurrency(const SetConcurrencyRequest& req) {
  return ObserveRpc("QueueService.SetConcurrency", {}, [&] { return ToProto(ctx_.jobs->SetConcurrency(req.concurrency())); });
}

QueueSettings QueueService::SetPaused(const SetPausedRequest& req) {
  return ObserveRpc("QueueService.SetPaused", {}, [&] { return ToProto(ctx_.jobs->SetPaused(req.paused())); });
}

} // namespace sandbox::service
