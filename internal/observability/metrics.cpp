#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/common/key_value_iterable_view.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace sandbox::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

constexpr const char* kMeterName    = "sandbox-orchestrator";
constexpr const char* kMeterVersion = "0.1.0";

// Owns the label strings for the duration of one recording.
using Labels = std::map<std::string, std::string>;

std::mutex                                 g_provider_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  const auto endpoint = ResolveEndpoint(settings, OtlpSignal::kMetrics);
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, const Labels& labels) {
  if (!instrument) return;
  instrument->Add(value, opentelemetry::common::KeyValueIterableView<Labels>(labels), opentelemetry::context::Context{});
}

template <typename Instrument, typename Value>
void Record(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, const Labels& labels) {
  if (!instrument) return;
  instrument->Record(value, opentelemetry::common::KeyValueIterableView<Labels>(labels), opentelemetry::context::Context{});
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rpc_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> job_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      job_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   tracked_projects_gauge;

  std::atomic<std::int64_t> tracked_projects{0};

  static void ObserveTrackedProjects(metrics_api::ObserverResult result, void* state) {
    auto* self = static_cast<Impl*>(state);
    if (auto* observer = opentelemetry::nostd::get_if<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(&result)) {
      (*observer)->Observe(self->tracked_projects.load());
    }
  }
};

bool InitializeMetrics(const sandbox::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto settings = ResolveOtlpSettings(observability);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(settings.export_interval_ms);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(settings.export_interval_ms / 2);

  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : ResourceAttributes(settings)) {
    attrs.SetAttribute(key, value);
  }

  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), reader_options));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(provider));

  std::lock_guard lock(g_provider_mutex);
  g_provider = std::move(provider);
  return true;
}

void ShutdownMetrics() {
  std::shared_ptr<sdkmetrics::MeterProvider> provider;
  {
    std::lock_guard lock(g_provider_mutex);
    provider = std::move(g_provider);
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

/*
  Instruments bind to whichever provider is global on first use, so
  InitializeMetrics must run before anything records.
*/
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kMeterName, kMeterVersion);

  impl_->rpc_count       = impl_->meter->CreateUInt64Counter("sandbox.rpc.count", "RPCs handled by method and result", "1");
  impl_->rpc_latency_ms  = impl_->meter->CreateDoubleHistogram("sandbox.rpc.latency_ms", "RPC latency", "ms");
  impl_->job_outcomes    = impl_->meter->CreateUInt64Counter("sandbox.job.outcomes", "Job executions by type and outcome", "1");
  impl_->job_duration_ms = impl_->meter->CreateDoubleHistogram("sandbox.job.duration_ms", "Handler execution time", "ms");
  impl_->tracked_projects_gauge =
      impl_->meter->CreateInt64ObservableGauge("sandbox.presence.tracked_projects", "Projects with in-memory presence", "1");
  impl_->tracked_projects_gauge->AddCallback(&Impl::ObserveTrackedProjects, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  Add(impl_->rpc_count, static_cast<std::uint64_t>(1), Labels{{"route", std::string(route)}, {"success", success ? "true" : "false"}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  Record(impl_->rpc_latency_ms, latency_ms, Labels{{"route", std::string(route)}});
}

void Metrics::RecordJobOutcome(std::string_view job_type, std::string_view outcome) {
  Add(impl_->job_outcomes, static_cast<std::uint64_t>(1), Labels{{"job_type", std::string(job_type)}, {"outcome", std::string(outcome)}});
}

void Metrics::ObserveJobDurationMs(std::string_view job_type, double duration_ms) {
  Record(impl_->job_duration_ms, duration_ms, Labels{{"job_type", std::string(job_type)}});
}

void Metrics::SetTrackedProjects(std::uint64_t count) {
  impl_->tracked_projects.store(static_cast<std::int64_t>(count));
}

} // namespace sandbox::observability

#endif
