#include "internal/observability/otlp_settings.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "config/config.pb.h"

namespace {

using sandbox::observability::OtlpSignal;
using sandbox::observability::ResolveEndpoint;
using sandbox::observability::ResolveOtlpSettings;
using sandbox::runtime::config::ObservabilityConfig;

void ClearEnv() {
  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

void TestDefaults() {
  ClearEnv();
  const auto settings = ResolveOtlpSettings(ObservabilityConfig{});
  assert(settings.service_name == "sandbox-orchestrator");
  assert(!settings.http);
  assert(settings.sample_ratio == 1.0);
  assert(ResolveEndpoint(settings, OtlpSignal::kTraces) == "localhost:4317");
  assert(ResolveEndpoint(settings, OtlpSignal::kMetrics) == "localhost:4317");
}

void TestHttpEndpointsPerSignal() {
  ClearEnv();
  ObservabilityConfig config;
  config.set_transport(sandbox::runtime::config::OTLP_TRANSPORT_HTTP);
  const auto settings = ResolveOtlpSettings(config);
  assert(settings.http);
  assert(ResolveEndpoint(settings, OtlpSignal::kTraces) == "http://localhost:4318/v1/traces");
  assert(ResolveEndpoint(settings, OtlpSignal::kMetrics) == "http://localhost:4318/v1/metrics");
}

void TestEnvironmentOverridesDefaultButNotConfig() {
  ClearEnv();
  ::setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "collector:4317", 1);
  ::setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "traces:4317", 1);

  ObservabilityConfig config;
  auto                settings = ResolveOtlpSettings(config);
  assert(ResolveEndpoint(settings, OtlpSignal::kTraces) == "traces:4317");
  assert(ResolveEndpoint(settings, OtlpSignal::kMetrics) == "collector:4317");

  config.set_otlp_endpoint("configured:4317");
  settings = ResolveOtlpSettings(config);
  assert(ResolveEndpoint(settings, OtlpSignal::kTraces) == "configured:4317");
  ClearEnv();
}

void TestSampleRatioAndIdentity() {
  ObservabilityConfig config;
  config.set_trace_sample_ratio(0.25);
  config.set_service_name("orchestrator-a");
  config.set_environment("staging");
  config.set_metrics_export_interval_ms(2500);

  const auto settings = ResolveOtlpSettings(config);
  assert(settings.sample_ratio == 0.25);
  assert(settings.export_interval_ms == 2500);

  bool saw_name = false;
  bool saw_env  = false;
  for (const auto& [key, value] : sandbox::observability::ResourceAttributes(settings)) {
    if (key == "service.name") saw_name = value == "orchestrator-a";
    if (key == "deployment.environment") saw_env = value == "staging";
  }
  assert(saw_name && saw_env);

  config.set_trace_sample_ratio(0.0);
  assert(ResolveOtlpSettings(config).sample_ratio == 1.0);
}

} // namespace

int main() {
  TestDefaults();
  TestHttpEndpointsPerSignal();
  TestEnvironmentOverridesDefaultButNotConfig();
  TestSampleRatioAndIdentity();

  std::cout << "sandbox_unit_otlp_settings: pass\n";
  return 0;
}
