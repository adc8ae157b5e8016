#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace sandbox::runtime::config {
class RuntimeConfig;
}

namespace sandbox::observability {

// Both return false when the pipeline is disabled in config or compiled out.
bool InitializeTracing(const sandbox::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const sandbox::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Starts a span and makes it current for the lifetime of the object.
  Without ENABLE_OTEL every member is an empty inline function.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;
  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // Records the error as an exception event and sets error status.
  void MarkFailed(std::string_view error);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments.

  Job outcomes are labelled by job type and one of
  succeeded/failed/retried/cancelled/rescheduled.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordJobOutcome(std::string_view job_type, std::string_view outcome);
  void ObserveJobDurationMs(std::string_view job_type, double duration_ms);
  void SetTrackedProjects(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const sandbox::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const sandbox::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::MarkFailed(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordJobOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveJobDurationMs(std::string_view, double) {
}

inline void Metrics::SetTrackedProjects(std::uint64_t) {
}
#endif

} // namespace sandbox::observability
