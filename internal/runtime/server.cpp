#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include <grpcpp/health_check_service_interface.h>

#include "internal/observability/logging.hpp"

namespace sandbox::runtime {

namespace {

// Open WatchJobs streams get this long to notice shutdown.
constexpr auto kShutdownDeadline = std::chrono::seconds(5);

constexpr int kKeepaliveTimeMs    = 30000;
constexpr int kKeepaliveTimeoutMs = 10000;

} // namespace

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::EnableDefaultHealthCheckService(true);

  ::grpc::ServerBuilder builder;
  // Keep idle WatchJobs streams alive through proxies.
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, kKeepaliveTimeMs);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, kKeepaliveTimeoutMs);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &bound_port_);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  server_ = builder.BuildAndStart();

  if (!server_ || bound_port_ == 0) {
    server_.reset();
    bound_port_ = 0;
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  SANDBOX_LOG_INFO("Sandbox orchestrator listening", {observability::StringField("bind_address", bind_address_),
                                                     observability::IntField("port", bound_port_),
                                                     observability::IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Wait() {
  if (server_)
    server_->Wait();
}

void Server::Stop() {
  if (!server_) return;

  SANDBOX_LOG_INFO("Sandbox orchestrator shutting down", {observability::IntField("deadline_s", kShutdownDeadline.count())});
  if (auto* health = server_->GetHealthCheckService()) {
    health->Shutdown();
  }
  server_->Shutdown(std::chrono::system_clock::now() + kShutdownDeadline);
  server_.reset();
}

} // namespace sandbox::runtime
