#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace sandbox::runtime::config {
class RuntimeConfig;
}

namespace sandbox::observability {

/*
  Structured log lines: the event text followed by key=value fields.

    SANDBOX_LOG_INFO("job claimed", {StringField("job_id", id), IntField("attempt", n)});

  Fields are only built when the level is enabled.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

void InitializeLogging(const sandbox::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

bool LogEnabled(spdlog::level::level_enum level);
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace sandbox::observability

#define SANDBOX_LOG_AT(level, message, ...)                                  \
  do {                                                                       \
    if (::sandbox::observability::LogEnabled(level)) {                       \
      ::sandbox::observability::Log((level), (message), ##__VA_ARGS__);      \
    }                                                                        \
  } while (0)

#define SANDBOX_LOG_DEBUG(message, ...) SANDBOX_LOG_AT(::spdlog::level::debug, message, ##__VA_ARGS__)
#define SANDBOX_LOG_INFO(message, ...) SANDBOX_LOG_AT(::spdlog::level::info, message, ##__VA_ARGS__)
#define SANDBOX_LOG_WARN(message, ...) SANDBOX_LOG_AT(::spdlog::level::warn, message, ##__VA_ARGS__)
#define SANDBOX_LOG_ERROR(message, ...) SANDBOX_LOG_AT(::spdlog::level::err, message, ##__VA_ARGS__)
