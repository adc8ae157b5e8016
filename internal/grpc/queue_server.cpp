#include "queue_server.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "grpc_error.hpp"

namespace sandbox::grpc {

using namespace sandbox::orchestrator::v1;

namespace {

constexpr uint32_t kDefaultWatchIntervalMs = 2000;
constexpr uint32_t kMinWatchIntervalMs     = 250;
constexpr auto     kCancelCheckSlice       = std::chrono::milliseconds(100);

} // namespace

QueueServer::QueueServer(std::shared_ptr<sandbox::service::QueueService> svc, std::shared_ptr<AdminAuth> auth)
    : service_(std::move(svc)), auth_(std::move(auth)) {}

::grpc::Status QueueServer::ListJobs(::grpc::ServerContext*, const ListJobsRequest* req, ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::CountJobs(::grpc::ServerContext*, const CountJobsRequest* req, CountJobsResponse* resp) {
  try {
    *resp = service_->CountJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::GetJob(::grpc::ServerContext*, const GetJobRequest* req, Job* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::WatchJobs(::grpc::ServerContext* context, const WatchJobsRequest* req,
                                      ::grpc::ServerWriter<JobsSnapshot>* writer) {
  const uint32_t interval_ms =
      req->interval_ms() == 0 ? kDefaultWatchIntervalMs : std::max(req->interval_ms(), kMinWatchIntervalMs);

  try {
    uint64_t sequence = 0;
    while (!context->IsCancelled()) {
      if (!writer->Write(service_->Snapshot(*req, ++sequence))) {
        break;
      }

      const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(interval_ms);
      while (!context->IsCancelled() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kCancelCheckSlice);
      }
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::GetSettings(::grpc::ServerContext*, const GetSettingsRequest* req, QueueSettings* resp) {
  try {
    *resp = service_->GetSettings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::CancelJob(::grpc::ServerContext* context, const JobIdRequest* req, Job* resp) {
  try {
    auth_->Require(context);
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::RetryJob(::grpc::ServerContext* context, const JobIdRequest* req, Job* resp) {
  try {
    auth_->Require(context);
    *resp = service_->Retry(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::RunJobNow(::grpc::ServerContext* context, const JobIdRequest* req, Job* resp) {
  try {
    auth_->Require(context);
    *resp = service_->RunNow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::ForceUnlockJob(::grpc::ServerContext* context, const JobIdRequest* req, Job* resp) {
  try {
    auth_->Require(context);
    *resp = service_->ForceUnlock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::DeleteJob(::grpc::ServerContext* context, const JobIdRequest* req, google::protobuf::Empty*) {
  try {
    auth_->Require(context);
    service_->Delete(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::DeleteJobsByState(::grpc::ServerContext* context, const DeleteJobsByStateRequest* req,
                                              DeleteJobsByStateResponse* resp) {
  try {
    auth_->Require(context);
    *resp = service_->DeleteByState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::SetConcurrency(::grpc::ServerContext* context, const SetConcurrencyRequest* req,
                                           QueueSettings* resp) {
  try {
    auth_->Require(context);
    *resp = service_->SetConcurrency(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::SetPaused(::grpc::ServerContext* context, const SetPausedRequest* req, QueueSettings* resp) {
  try {
    auth_->Require(context);
    *resp = service_->SetPaused(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sandbox::grpc
