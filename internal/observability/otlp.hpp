#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

namespace refiner::runtime::config {
class ObservabilityConfig;
}

namespace refiner::observability {

inline constexpr const char* kInstrumentationName    = "threat-refiner";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

bool OtlpOverHttp(const refiner::runtime::config::ObservabilityConfig& config);

// Config first, then OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then
// OTEL_EXPORTER_OTLP_ENDPOINT, then the local collector default.
std::string OtlpEndpoint(const refiner::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

opentelemetry::sdk::resource::Resource ServiceResource();

} // namespace refiner::observability

#endif
