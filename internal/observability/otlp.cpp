#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

#include "config/config.pb.h"

namespace refiner::observability {

bool OtlpOverHttp(const refiner::runtime::config::ObservabilityConfig& config) {
  return config.transport() == refiner::runtime::config::OTLP_TRANSPORT_HTTP;
}

std::string OtlpEndpoint(const refiner::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  const char* specific = std::getenv(signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  if (specific) return specific;
  if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return shared;

  if (!OtlpOverHttp(config)) return "localhost:4317";
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

opentelemetry::sdk::resource::Resource ServiceResource() {
  const std::string                                name    = kInstrumentationName;
  const std::string                                version = kInstrumentationVersion;
  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", name}, {"service.version", version}};
  return opentelemetry::sdk::resource::Resource::Create(attributes);
}

} // namespace refiner::observability

#endif
