#pragma once

#include <chrono>
#include <string>

#include "internal/external/session_client.hpp"

namespace sandbox::runtime::config {
class RuntimeConfig;
}

namespace sandbox::external {

struct HttpSessionOptions {
  std::string               host = "localhost";
  std::string               path = "/session";
  std::chrono::milliseconds timeout{10000};

  static HttpSessionOptions FromConfig(const sandbox::runtime::config::RuntimeConfig& config);
};

// POSTs to the project's runtime port; non-2xx answers throw.
class HttpSessionClient final : public SessionClient {
 public:
  explicit HttpSessionClient(HttpSessionOptions options);

  void CreateSession(const db::model::ProjectRecord& project) override;

 private:
  HttpSessionOptions options_;
};

} // namespace sandbox::external
