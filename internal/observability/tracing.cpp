#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/scope.h>

#include <string>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace refiner::observability {

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider> g_provider;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const refiner::runtime::config::ObservabilityConfig& config) {
  const auto endpoint = OtlpEndpoint(config, OtlpSignal::kTraces);
  if (OtlpOverHttp(config)) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint = endpoint;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::string Key(std::string_view key) {
  return "refiner." + std::string(key);
}

} // namespace

bool InitializeTracing(const refiner::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config.observability()), sdktrace::BatchSpanProcessorOptions{});
  g_provider     = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), ServiceResource()));
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

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> started) : span(started), scope(started) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  auto tracer = trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentationName, kInstrumentationVersion);
  impl_       = std::make_unique<Impl>(tracer->StartSpan(std::string(name)));
}

SpanScope::~SpanScope() {
  impl_->span->End();
}

void SpanScope::SetCount(std::string_view key, std::size_t value) {
  impl_->span->SetAttribute(Key(key), static_cast<std::int64_t>(value));
}

void SpanScope::SetLabel(std::string_view key, std::string_view value) {
  impl_->span->SetAttribute(Key(key), std::string(value));
}

void SpanScope::Fail(std::string_view error) {
  impl_->span->AddEvent("exception", {{"exception.message", std::string(error)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(error));
}

} // namespace refiner::observability

#endif
