#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace roadcast::runtime::config {
class RuntimeConfig;
}

namespace roadcast::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"roadcast"};
  std::string   service_version{"0.1.0"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const roadcast::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const roadcast::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

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
  void SetAttribute(std::string_view key, double value);
  void SetAttribute(std::string_view key, bool value);
  // Sets "<prefix>.lat" and "<prefix>.lon".
  void SetCoordinate(std::string_view prefix, double lat, double lon);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  // tier: "fast" | "durable", outcome: "hit" | "miss" | "error"
  void RecordCacheLookup(std::string_view tier, std::string_view outcome);
  void RecordProviderCall(std::string_view provider, bool success);
  // role: "leader" | "follower" | "follower_timeout" | "expired_lock"
  void RecordGateRole(std::string_view role);
  void RecordStaleServe(std::string_view kind);
  void RecordGraphInjection(std::uint64_t edges);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const roadcast::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const roadcast::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::SetAttribute(std::string_view, bool) {
}

inline void SpanScope::SetCoordinate(std::string_view, double, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
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

inline void Metrics::RecordCacheLookup(std::string_view, std::string_view) {
}

inline void Metrics::RecordProviderCall(std::string_view, bool) {
}

inline void Metrics::RecordGateRole(std::string_view) {
}

inline void Metrics::RecordStaleServe(std::string_view) {
}

inline void Metrics::RecordGraphInjection(std::uint64_t) {
}
#endif

} // namespace roadcast::observability
