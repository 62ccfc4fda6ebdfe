#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

namespace refiner::runtime::config {
class RuntimeConfig;
}

namespace refiner::observability {

// Both return false when the signal is disabled in config or the build
// has no OpenTelemetry support.
bool InitializeTracing(const refiner::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const refiner::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Active span for the current scope: one per RPC, refinement run or
  pipeline stage. Attribute keys are recorded under the "refiner."
  prefix.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetCount(std::string_view key, std::size_t value);
  void SetLabel(std::string_view key, std::string_view value);
  void Fail(std::string_view error);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide refinement metrics.

    refiner.rpc.count / refiner.rpc.latency_ms     per route and outcome
    refiner.stage.duration_ms / refiner.stage.changed  per pipeline stage
    refiner.threat.outcomes                       threats by final status
    refiner.cve.lookups                           cited CVEs by source
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRpc(std::string_view route, bool success, double latency_ms);
  void RecordStage(std::string_view stage, double duration_ms, std::size_t changed);
  void RecordThreatOutcome(std::string_view outcome, std::uint64_t count);
  // source: cache, feed, stale or unknown
  void RecordCveLookups(std::string_view source, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const refiner::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const refiner::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetCount(std::string_view, std::size_t) {
}

inline void SpanScope::SetLabel(std::string_view, std::string_view) {
}

inline void SpanScope::Fail(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRpc(std::string_view, bool, double) {
}

inline void Metrics::RecordStage(std::string_view, double, std::size_t) {
}

inline void Metrics::RecordThreatOutcome(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordCveLookups(std::string_view, std::uint64_t) {
}
#endif

} // namespace refiner::observability
