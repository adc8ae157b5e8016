#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <algorithm>
#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace sandbox::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kTracerName    = "sandbox-orchestrator";
constexpr const char* kTracerVersion = "0.1.0";

struct TracingState {
  std::mutex                                          mutex;
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
};

TracingState& State() {
  static TracingState state;
  return state;
}

// Tracer from our provider, else whatever global provider is installed.
opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  auto&           state = State();
  std::lock_guard lock(state.mutex);
  if (!state.tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      state.tracer = provider->GetTracer(kTracerName, kTracerVersion);
    }
  }
  return state.tracer;
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpSettings& settings) {
  const auto endpoint = ResolveEndpoint(settings, OtlpSignal::kTraces);
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

resource::Resource MakeResource(const OtlpSettings& settings) {
  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : ResourceAttributes(settings)) {
    attrs.SetAttribute(key, value);
  }
  return resource::Resource::Create(attrs);
}

// Children follow their parent's decision; roots are sampled by ratio.
std::unique_ptr<sdktrace::Sampler> MakeSampler(double ratio) {
  return sdktrace::ParentBasedSamplerFactory::Create(std::shared_ptr<sdktrace::Sampler>(sdktrace::TraceIdRatioBasedSamplerFactory::Create(ratio)));
}

} // namespace

bool InitializeTracing(const sandbox::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto settings  = ResolveOtlpSettings(observability);
  auto       processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(settings), sdktrace::BatchSpanProcessorOptions{});
  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), MakeResource(settings), MakeSampler(settings.sample_ratio));

  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));

  auto&           state = State();
  std::lock_guard lock(state.mutex);
  state.provider = std::move(provider);
  state.tracer   = state.provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(state.tracer);
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    auto&           state = State();
    std::lock_guard lock(state.mutex);
    provider = std::move(state.provider);
    state.tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (!impl_ || !impl_->span) return;
  impl_->scope.reset();
  impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::MarkFailed(std::string_view error) {
  if (!impl_ || !impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(error)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(error));
}

} // namespace sandbox::observability

#endif
