#include "http_health_probe.hpp"

#include "config/config.pb.h"
#include "internal/external/http_client.hpp"
#include "internal/observability/logging.hpp"

namespace sandbox::external {

HttpProbeOptions HttpProbeOptions::FromConfig(const sandbox::runtime::config::RuntimeConfig& config) {
  HttpProbeOptions options;
  if (!config.presence().preview_host().empty()) options.preview_host = config.presence().preview_host();
  if (config.containers().probe_timeout_ms() > 0) {
    options.timeout = std::chrono::milliseconds(config.containers().probe_timeout_ms());
  }
  return options;
}

HttpHealthProbe::HttpHealthProbe(HttpProbeOptions options) : options_(std::move(options)) {
}

bool HttpHealthProbe::PreviewReady(const db::model::ProjectRecord& project) {
  return project.dev_port != 0 && Probe(options_.preview_host, project.dev_port);
}

bool HttpHealthProbe::RuntimeReady(const db::model::ProjectRecord& project) {
  return project.runtime_port != 0 && Probe(options_.preview_host, project.runtime_port);
}

bool HttpHealthProbe::ProductionReady(uint32_t port) {
  return port != 0 && Probe(options_.production_host, port);
}

bool HttpHealthProbe::Probe(const std::string& host, uint32_t port) {
  HttpRequest request;
  request.host    = host;
  request.port    = port;
  request.timeout = options_.timeout;
  try {
    const auto response = SendHttpRequest(request);
    return response.status > 0;
  } catch (const std::exception& e) {
    SANDBOX_LOG_DEBUG("probe failed", {observability::StringField("host", host), observability::IntField("port", port),
                                       observability::StringField("error", e.what())});
    return false;
  }
}

} // namespace sandbox::external
