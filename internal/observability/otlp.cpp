#include "internal/observability/otlp.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace gate::observability {

namespace {

const char* SignalPath(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "/v1/traces" : "/v1/metrics";
}

const char* SignalEnv(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

} // namespace

bool UseOtlpHttp(const gate::runtime::config::ObservabilityConfig& config) {
  return config.transport() == gate::runtime::config::OTLP_TRANSPORT_HTTP;
}

std::string OtlpEndpoint(const gate::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  if (const char* endpoint = std::getenv(SignalEnv(signal)); endpoint && *endpoint) {
    return endpoint;
  }

  const bool http = UseOtlpHttp(config);
  if (const char* base = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); base && *base) {
    if (!http) return base;

    std::string url(base);
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url + SignalPath(signal);
  }

  return http ? std::string("http://localhost:4318") + SignalPath(signal) : std::string("localhost:4317");
}

} // namespace gate::observability
