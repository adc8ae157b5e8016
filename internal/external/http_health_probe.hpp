#pragma once

#include <chrono>
#include <string>

#include "internal/external/health_probe.hpp"

namespace sandbox::runtime::config {
class RuntimeConfig;
}

namespace sandbox::external {

struct HttpProbeOptions {
  std::string               preview_host    = "localhost";
  std::string               production_host = "127.0.0.1";
  std::chrono::milliseconds timeout{2000};

  static HttpProbeOptions FromConfig(const sandbox::runtime::config::RuntimeConfig& config);
};

// Any HTTP response counts as ready; refusal, timeout or garbage does not.
class HttpHealthProbe final : public HealthProbe {
 public:
  explicit HttpHealthProbe(HttpProbeOptions options);

  bool PreviewReady(const db::model::ProjectRecord& project) override;
  bool RuntimeReady(const db::model::ProjectRecord& project) override;
  bool ProductionReady(uint32_t port) override;

 private:
  bool Probe(const std::string& host, uint32_t port);

  HttpProbeOptions options_;
};

} // namespace sandbox::external
