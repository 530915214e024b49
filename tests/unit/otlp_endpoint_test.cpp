#include "internal/observability/otlp.hpp"

#include "config/config.pb.h"

#include <cassert>
#include <cstdlib>
#include <iostream>

namespace {

using gate::observability::OtlpEndpoint;
using gate::observability::OtlpSignal;
using gate::runtime::config::ObservabilityConfig;

void ClearEnvironment() {
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

ObservabilityConfig Http() {
  ObservabilityConfig config;
  config.set_transport(gate::runtime::config::OTLP_TRANSPORT_HTTP);
  return config;
}

void TestDefaults() {
  ObservabilityConfig grpc;
  assert(OtlpEndpoint(grpc, OtlpSignal::kTraces) == "localhost:4317");
  assert(OtlpEndpoint(grpc, OtlpSignal::kMetrics) == "localhost:4317");

  assert(OtlpEndpoint(Http(), OtlpSignal::kTraces) == "http://localhost:4318/v1/traces");
  assert(OtlpEndpoint(Http(), OtlpSignal::kMetrics) == "http://localhost:4318/v1/metrics");
}

void TestConfiguredEndpointWins() {
  setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "env:4317", 1);

  ObservabilityConfig config;
  config.set_otlp_endpoint("collector:4317");
  assert(OtlpEndpoint(config, OtlpSignal::kTraces) == "collector:4317");

  ClearEnvironment();
}

void TestSignalEnvironmentBeatsGeneric() {
  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://generic:4318", 1);
  setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "http://metrics:4318/custom", 1);

  assert(OtlpEndpoint(Http(), OtlpSignal::kMetrics) == "http://metrics:4318/custom");
  assert(OtlpEndpoint(Http(), OtlpSignal::kTraces) == "http://generic:4318/v1/traces");

  ClearEnvironment();
}

void TestGenericEndpointPath() {
  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://otel:4318/", 1);
  assert(OtlpEndpoint(Http(), OtlpSignal::kMetrics) == "http://otel:4318/v1/metrics");

  // grpc takes the address as-is
  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "otel:4317", 1);
  assert(OtlpEndpoint(ObservabilityConfig{}, OtlpSignal::kTraces) == "otel:4317");

  ClearEnvironment();
}

} // namespace

int main() {
  ClearEnvironment();

  TestDefaults();
  TestConfiguredEndpointWins();
  TestSignalEnvironmentBeatsGeneric();
  TestGenericEndpointPath();

  std::cout << "submission_gate_unit_otlp_endpoint: pass\n";
  return 0;
}
