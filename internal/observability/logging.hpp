#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace roadcast::runtime::config {
class RuntimeConfig;
}

namespace roadcast::observability {

/*
  Structured logging on top of spdlog.

  Every line is "<message> key=value key=value ...". Values holding spaces
  or quotes are quoted so place names survive a grep.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);
LogField CoordField(std::string_view key, double lat, double lon);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

// Level, pattern and trace context come from the environment
// (ROADCAST_LOG_LEVEL, ROADCAST_LOG_PATTERN, ROADCAST_LOG_INCLUDE_TRACE_CONTEXT)
// first, then the logging section of the config.
void InitializeLogging(const roadcast::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace roadcast::observability

#define ROADCAST_LOG_DEBUG(message, ...) ::roadcast::observability::LogDebug((message), ##__VA_ARGS__)
#define ROADCAST_LOG_INFO(message, ...) ::roadcast::observability::LogInfo((message), ##__VA_ARGS__)
#define ROADCAST_LOG_WARN(message, ...) ::roadcast::observability::LogWarn((message), ##__VA_ARGS__)
#define ROADCAST_LOG_ERROR(message, ...) ::roadcast::observability::LogError((message), ##__VA_ARGS__)
