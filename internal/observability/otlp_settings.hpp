#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sandbox::runtime::config {
class ObservabilityConfig;
}

namespace sandbox::observability {

enum class OtlpSignal { kTraces, kMetrics };

/*
  Exporter settings shared by the trace and metric pipelines, resolved
  once from the observability config section.
*/
struct OtlpSettings {
  std::string   service_name{"sandbox-orchestrator"};
  std::string   service_version{"0.1.0"};
  std::string   environment;
  std::string   endpoint;
  bool          http{false};
  bool          insecure{true};
  std::uint32_t export_interval_ms{10000};
  double        sample_ratio{1.0};
};

OtlpSettings ResolveOtlpSettings(const sandbox::runtime::config::ObservabilityConfig& observability);

// Configured endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
std::string ResolveEndpoint(const OtlpSettings& settings, OtlpSignal signal);

// service.*, deployment.environment and host.name.
std::vector<std::pair<std::string, std::string>> ResourceAttributes(const OtlpSettings& settings);

} // namespace sandbox::observability
