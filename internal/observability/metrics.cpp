#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace gate::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

// values must outlive the list; they are views
using Attributes = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

constexpr uint32_t kDefaultExportIntervalMs = 10000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const gate::runtime::config::ObservabilityConfig& config) {
  const auto endpoint = OtlpEndpoint(config, OtlpSignal::kMetrics);

  if (UseOtlpHttp(config)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint = endpoint;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

// Instruments bind to whichever provider is global when Instance() first
// runs, so InitializeMetrics must precede the first request.
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> decisions;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      stage_latency_ms;
};

bool InitializeMetrics(const gate::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const uint32_t interval_ms =
      observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : kDefaultExportIntervalMs;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  // export must finish inside one interval
  reader_options.export_timeout_millis = std::chrono::milliseconds(interval_ms / 2);

  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", "submission-gate"}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           opentelemetry::sdk::resource::Resource::Create(attrs));
  g_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(observability), reader_options));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;

  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("submission-gate", "0.1.0");

  impl_->requests           = impl_->meter->CreateUInt64Counter("gate.http.requests", "HTTP requests by route and outcome", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("gate.http.latency_ms", "HTTP request latency", "ms");
  impl_->decisions          = impl_->meter->CreateUInt64Counter("gate.submission.decisions", "Pipeline decisions by reason", "1");
  impl_->stage_latency_ms   = impl_->meter->CreateDoubleHistogram("gate.submission.stage_latency_ms", "Verification stage latency", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::string label(route);
  const Attributes  attributes = {{"route", label}, {"success", success}};
  impl_->requests->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::string label(route);
  const Attributes  attributes = {{"route", label}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordDecision(std::string_view reason) {
  const std::string label(reason);
  const Attributes  attributes = {{"outcome", reason == "accepted" ? "accepted" : "rejected"}, {"reason", label}};
  impl_->decisions->Add(1, attributes);
}

void Metrics::ObserveStageLatencyMs(std::string_view stage, double latency_ms) {
  const std::string label(stage);
  const Attributes  attributes = {{"stage", label}};
  impl_->stage_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

} // namespace gate::observability

#endif
