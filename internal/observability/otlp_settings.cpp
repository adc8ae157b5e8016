#include "internal/observability/otlp_settings.hpp"

#include <unistd.h>

#include <cstdlib>

#include "config/config.pb.h"

namespace sandbox::observability {

OtlpSettings ResolveOtlpSettings(const sandbox::runtime::config::ObservabilityConfig& observability) {
  OtlpSettings settings;
  if (!observability.service_name().empty()) settings.service_name = observability.service_name();
  settings.environment = observability.environment();
  settings.endpoint    = observability.otlp_endpoint();
  settings.http        = observability.transport() == sandbox::runtime::config::OTLP_TRANSPORT_HTTP;
  if (observability.metrics_export_interval_ms() > 0) {
    settings.export_interval_ms = observability.metrics_export_interval_ms();
  }
  const double ratio    = observability.trace_sample_ratio();
  settings.sample_ratio = ratio > 0.0 && ratio < 1.0 ? ratio : 1.0;
  return settings;
}

std::string ResolveEndpoint(const OtlpSettings& settings, OtlpSignal signal) {
  if (!settings.endpoint.empty()) return settings.endpoint;

  const char* specific = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  for (const char* name : {specific, "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name); value != nullptr && *value != '\0') return value;
  }

  if (!settings.http) return "localhost:4317";
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

std::vector<std::pair<std::string, std::string>> ResourceAttributes(const OtlpSettings& settings) {
  std::vector<std::pair<std::string, std::string>> attrs{
      {"service.name", settings.service_name},
      {"service.version", settings.service_version},
  };
  if (!settings.environment.empty()) attrs.emplace_back("deployment.environment", settings.environment);

  char host[256] = {};
  if (::gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') attrs.emplace_back("host.name", host);
  return attrs;
}

} // namespace sandbox::observability
