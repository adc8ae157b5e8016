#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace sandbox::observability {
namespace {

constexpr const char* kLoggerName     = "sandbox-orchestrator";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::atomic<bool> g_include_trace_context{false};

// Environment wins over the config file.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') return value;
  if (!configured.empty()) return configured;
  return fallback;
}

bool TraceContextEnabled(const sandbox::runtime::config::LoggingConfig& logging) {
  if (const char* value = std::getenv("SANDBOX_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(value);
    return flag == "1" || flag == "true";
  }
  return logging.include_trace_context();
}

std::vector<spdlog::sink_ptr> MakeSinks(const sandbox::runtime::config::LoggingConfig& logging) {
  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};

  const auto file = Setting("SANDBOX_LOG_FILE", logging.file(), "");
  if (!file.empty()) {
    const std::size_t max_bytes = static_cast<std::size_t>(logging.max_file_size_mb() > 0 ? logging.max_file_size_mb() : 50) * 1024 * 1024;
    const std::size_t max_files = logging.max_files() > 0 ? logging.max_files() : 5;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, max_bytes, max_files));
  }
  return sinks;
}

/*
  key=value pairs separated by spaces. Values with spaces, quotes or
  '=' are double-quoted with embedded quotes escaped.
*/
void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) out.push_back(' ');
  out += field.key;
  out.push_back('=');

  if (field.value.find_first_of(" \"=") == std::string::npos && !field.value.empty()) {
    out += field.value;
    return;
  }
  out.push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& out, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context.load()) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  if (!out.empty()) out.push_back(' ');
  out += "trace_id=";
  AppendHex(out, trace_bytes, sizeof(trace_bytes));
  out += " span_id=";
  AppendHex(out, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

void InitializeLogging(const sandbox::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  spdlog::drop(kLoggerName);
  auto sinks  = MakeSinks(logging);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(Setting("SANDBOX_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("SANDBOX_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context.store(TraceContextEnabled(logging));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

bool LogEnabled(spdlog::level::level_enum level) {
  return spdlog::should_log(level);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {

  std::string suffix;
  for (const auto& field : fields) {
    AppendField(suffix, field);
  }
  AppendTraceContext(suffix);

  if (suffix.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, suffix);
  }
}

} // namespace sandbox::observability
