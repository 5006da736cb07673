#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace roadcast::service {

// Span, request metrics and an error log line around one service call.
// Exceptions are rethrown unchanged for the transport to map.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  roadcast::observability::SpanScope span(route);
  auto&                              metrics    = roadcast::observability::Metrics::Instance();
  const auto                         started_at = std::chrono::steady_clock::now();
  const auto                         elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ROADCAST_LOG_ERROR("RPC failed", {roadcast::observability::StringField("route", route), roadcast::observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace roadcast::service
