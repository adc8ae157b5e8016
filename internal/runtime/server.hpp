#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace sandbox::runtime {

/*
  Owns the gRPC server and the services registered on it.

  Start() throws when the address cannot be bound. Stop() drains open
  streams for a bounded time and is safe to call more than once.
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; 0 before Start().
  int BoundPort() const {
    return bound_port_;
  }

private:
  const std::string                             bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               server_;
  int                                           bound_port_ = 0;
};

} // namespace sandbox::runtime
