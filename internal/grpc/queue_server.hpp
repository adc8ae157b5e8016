#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "admin_auth.hpp"
#include "internal/service/queue_service.hpp"
#include "sandbox/orchestrator/v1.hpp"

namespace sandbox::grpc {

class QueueServer final : public sandbox::orchestrator::v1::SandboxQueueService::Service {
public:
  QueueServer(std::shared_ptr<sandbox::service::QueueService> svc, std::shared_ptr<AdminAuth> auth);

  ::grpc::Status ListJobs(::grpc::ServerContext*,
                          const sandbox::orchestrator::v1::ListJobsRequest*,
                          sandbox::orchestrator::v1::ListJobsResponse*) override;

  ::grpc::Status CountJobs(::grpc::ServerContext*,
                           const sandbox::orchestrator::v1::CountJobsRequest*,
                           sandbox::orchestrator::v1::CountJobsResponse*) override;

  ::grpc::Status GetJob(::grpc::ServerContext*,
                        const sandbox::orchestrator::v1::GetJobRequest*,
                        sandbox::orchestrator::v1::Job*) override;

  ::grpc::Status WatchJobs(::grpc::ServerContext*,
                           const sandbox::orchestrator::v1::WatchJobsRequest*,
                           ::grpc::ServerWriter<sandbox::orchestrator::v1::JobsSnapshot>*) override;

  ::grpc::Status GetSettings(::grpc::ServerContext*,
                             const sandbox::orchestrator::v1::GetSettingsRequest*,
                             sandbox::orchestrator::v1::QueueSettings*) override;

  ::grpc::Status CancelJob(::grpc::ServerContext*,
                           const sandbox::orchestrator::v1::JobIdRequest*,
                           sandbox::orchestrator::v1::Job*) override;

  ::grpc::Status RetryJob(::grpc::ServerContext*,
                          const sandbox::orchestrator::v1::JobIdRequest*,
                          sandbox::orchestrator::v1::Job*) override;

  ::grpc::Status RunJobNow(::grpc::ServerContext*,
                           const sandbox::orchestrator::v1::JobIdRequest*,
                           sandbox::orchestrator::v1::Job*) override;

  ::grpc::Status ForceUnlockJob(::grpc::ServerContext*,
                                const sandbox::orchestrator::v1::JobIdRequest*,
                                sandbox::orchestrator::v1::Job*) override;

  ::grpc::Status DeleteJob(::grpc::ServerContext*,
                           const sandbox::orchestrator::v1::JobIdRequest*,
                           google::protobuf::Empty*) override;

  ::grpc::Status DeleteJobsByState(::grpc::ServerContext*,
                                   const sandbox::orchestrator::v1::DeleteJobsByStateRequest*,
                                   sandbox::orchestrator::v1::DeleteJobsByStateResponse*) override;

  ::grpc::Status SetConcurrency(::grpc::ServerContext*,
                                const sandbox::orchestrator::v1::SetConcurrencyRequest*,
                                sandbox::orchestrator::v1::QueueSettings*) override;

  ::grpc::Status SetPaused(::grpc::ServerContext*,
                           const sandbox::orchestrator::v1::SetPausedRequest*,
                           sandbox::orchestrator::v1::QueueSettings*) override;

private:
  std::shared_ptr<sandbox::service::QueueService> service_;
  std::shared_ptr<AdminAuth>                      auth_;
};

} // namespace sandbox::grpc
