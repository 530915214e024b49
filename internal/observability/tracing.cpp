#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/scope.h>

#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace gate::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

constexpr const char* kTracerName    = "submission-gate";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider> g_provider;

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const gate::runtime::config::ObservabilityConfig& config) {
  const auto endpoint = OtlpEndpoint(config, OtlpSignal::kTraces);

  if (UseOtlpHttp(config)) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint = endpoint;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Spans are looked up per call so a provider installed after the first
// request still takes effect.
opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer(kTracerName, kTracerVersion);
}

} // namespace

bool InitializeTracing(const gate::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const double ratio = observability.has_trace_sample_ratio() ? observability.trace_sample_ratio() : 1.0;

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(BuildExporter(observability), sdktrace::BatchSpanProcessorOptions{});
  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", kTracerName}};
  auto resource = opentelemetry::sdk::resource::Resource::Create(attrs);
  std::unique_ptr<sdktrace::TracerProvider> provider = sdktrace::TracerProviderFactory::Create(
      std::move(processor), resource, sdktrace::TraceIdRatioBasedSamplerFactory::Create(ratio));

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  return true;
}

void ShutdownTracing() {
  if (!g_provider) return;

  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>(Tracer()->StartSpan(std::string(name)))) {
}

SpanScope::~SpanScope() {
  impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::RecordException(std::string_view description) {
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace gate::observability

#endif
