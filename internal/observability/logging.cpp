#include "internal/observability/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <optional>
#include <string>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace roadcast::observability {
namespace {

constexpr const char* kLoggerName     = "roadcast";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};

std::optional<std::string> Env(const char* name) {
  if (const char* value = std::getenv(name); value && *value) {
    return std::string(value);
  }
  return std::nullopt;
}

spdlog::level::level_enum ResolveLevel(const roadcast::runtime::config::LoggingConfig& logging) {
  auto name = Env("ROADCAST_LOG_LEVEL").value_or(logging.level());
  if (name.empty()) return spdlog::level::info;
  if (name == "warning") name = "warn";
  // from_str maps unknown names to off; a typo should not silence the service.
  const auto level = spdlog::level::from_str(name);
  return level == spdlog::level::off && name != "off" ? spdlog::level::info : level;
}

bool ResolveTraceContext(const roadcast::runtime::config::LoggingConfig& logging) {
  if (auto flag = Env("ROADCAST_LOG_INCLUDE_TRACE_CONTEXT")) {
    return *flag == "1" || *flag == "true";
  }
  return logging.include_trace_context();
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=') return true;
  }
  return false;
}

void AppendField(fmt::memory_buffer& out, const LogField& field) {
  fmt::format_to(std::back_inserter(out), " {}=", field.key);
  if (!NeedsQuoting(field.value)) {
    out.append(field.value.data(), field.value.data() + field.value.size());
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
template <std::size_t N>
void AppendHex(fmt::memory_buffer& out, const std::uint8_t (&bytes)[N]) {
  for (auto b : bytes) fmt::format_to(std::back_inserter(out), "{:02x}", b);
}

void AppendTraceContext(fmt::memory_buffer& out) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  std::uint8_t trace_bytes[16];
  std::uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  out.append(std::string_view(" trace_id="));
  AppendHex(out, trace_bytes);
  out.append(std::string_view(" span_id="));
  AppendHex(out, span_bytes);
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
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
  return {std::string(key), fmt::format("{:g}", value)};
}

LogField CoordField(std::string_view key, double lat, double lon) {
  return {std::string(key), fmt::format("{:.5f},{:.5f}", lat, lon)};
}

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), fmt::format("{}ms", value.count())};
}

void InitializeLogging(const roadcast::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }

  const auto& logging = config.logging();
  logger->set_pattern(Env("ROADCAST_LOG_PATTERN").value_or(logging.pattern().empty() ? kDefaultPattern : logging.pattern()));
  logger->set_level(ResolveLevel(logging));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context.store(ResolveTraceContext(logging), std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (!logger->should_log(level)) return;

  fmt::memory_buffer line;
  line.append(message.data(), message.data() + message.size());
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);

  logger->log(level, std::string_view(line.data(), line.size()));
}

} // namespace roadcast::observability
