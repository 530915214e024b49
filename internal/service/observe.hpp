#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace gate::service {

// Span, request counter, latency histogram and an error log around one call.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  gate::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    gate::observability::Metrics::Instance().RecordRequest(route, success);
    gate::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    GATE_LOG_ERROR("request failed", {gate::observability::StringField("route", route), gate::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace gate::service
