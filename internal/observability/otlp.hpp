#pragma once

#include <string>

namespace gate::runtime::config {
class ObservabilityConfig;
}

namespace gate::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

bool UseOtlpHttp(const gate::runtime::config::ObservabilityConfig& config);

// Collector address for one signal. Precedence: otlp_endpoint from config,
// OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, OTEL_EXPORTER_OTLP_ENDPOINT
// (http gets the /v1/<signal> path appended), then the local collector.
std::string OtlpEndpoint(const gate::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

} // namespace gate::observability
