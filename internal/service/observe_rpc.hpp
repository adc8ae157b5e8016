#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace sandbox::service {

/*
  Runs one RPC body inside a span and records request count and latency.
  Failures are logged with the route and rethrown for the transport to
  map onto a status code.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool ok) {
    observability::Metrics::Instance().RecordRequest(route, ok);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.MarkFailed(ex.what());
    SANDBOX_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("subject", subject),
                                    observability::StringField("error", ex.what())});
    record(false);
    throw;
  }
}

} // namespace sandbox::service
