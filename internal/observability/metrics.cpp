#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>

#include <algorithm>
#include <chrono>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace refiner::observability {

namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const refiner::runtime::config::ObservabilityConfig& config) {
  const auto endpoint = OtlpEndpoint(config, OtlpSignal::kMetrics);
  if (OtlpOverHttp(config)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint = endpoint;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const refiner::runtime::config::RuntimeConfig& config) {
  ShutdownMetrics();
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.metrics_interval_ms() > 0 ? observability.metrics_interval_ms() : 5000);
  reader_options.export_timeout_millis = std::min(reader_options.export_timeout_millis, reader_options.export_interval_millis);

  std::shared_ptr<sdkmetrics::MetricReader> reader =
      sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(observability), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), ServiceResource());
  g_provider->AddMetricReader(reader);
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;

  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

// Instruments bind to the provider installed when Instance() first runs,
// so InitializeMetrics must precede the first recording.
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rpc_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      stage_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<std::uint64_t>> stage_changed;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> threat_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cve_lookups;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kInstrumentationName, kInstrumentationVersion);

  impl_->rpc_count         = meter->CreateUInt64Counter("refiner.rpc.count", "Refinement requests by route and outcome", "1");
  impl_->rpc_latency_ms    = meter->CreateDoubleHistogram("refiner.rpc.latency_ms", "End-to-end refinement latency", "ms");
  impl_->stage_duration_ms = meter->CreateDoubleHistogram("refiner.stage.duration_ms", "Pipeline stage duration", "ms");
  impl_->stage_changed     = meter->CreateUInt64Histogram("refiner.stage.changed", "Threats changed by a pipeline stage", "1");
  impl_->threat_outcomes   = meter->CreateUInt64Counter("refiner.threat.outcomes", "Threats by final status", "1");
  impl_->cve_lookups       = meter->CreateUInt64Counter("refiner.cve.lookups", "Cited CVEs by resolution source", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view route, bool success, double latency_ms) {
  const std::string route_name(route);
  impl_->rpc_count->Add(1, {{"route", route_name}, {"success", success}});
  impl_->rpc_latency_ms->Record(latency_ms, {{"route", route_name}, {"success", success}}, opentelemetry::context::Context{});
}

void Metrics::RecordStage(std::string_view stage, double duration_ms, std::size_t changed) {
  const std::string stage_name(stage);
  impl_->stage_duration_ms->Record(duration_ms, {{"stage", stage_name}}, opentelemetry::context::Context{});
  impl_->stage_changed->Record(static_cast<std::uint64_t>(changed), {{"stage", stage_name}}, opentelemetry::context::Context{});
}

void Metrics::RecordThreatOutcome(std::string_view outcome, std::uint64_t count) {
  if (count == 0) return;
  impl_->threat_outcomes->Add(count, {{"outcome", std::string(outcome)}});
}

void Metrics::RecordCveLookups(std::string_view source, std::uint64_t count) {
  if (count == 0) return;
  impl_->cve_lookups->Add(count, {{"source", std::string(source)}});
}

} // namespace refiner::observability

#endif
