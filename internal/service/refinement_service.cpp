#include "refinement_service.hpp"

#include <chrono>

#include "internal/core/refinement_orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/threat_mapping.hpp"
#include "internal/util/errors.hpp"
#include "refiner/v1.hpp"

namespace refiner::service {

using namespace refiner::v1;

namespace {

constexpr std::string_view kRoute = "RefinementService.RefineThreats";

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

} // namespace

RefinementService::RefinementService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.orchestrator) {
    throw util::InvalidConfig("refinement service requires an orchestrator");
  }
}

RefineThreatsResponse RefinementService::RefineThreats(const RefineThreatsRequest& req) {
  refiner::observability::SpanScope span(kRoute);
  const auto                        started_at = std::chrono::steady_clock::now();

  try {
    if (req.threats_size() == 0) {
      throw util::InvalidInput("refine threats: request carries no threats; supply at least one raw threat");
    }

    auto report = ctx_.orchestrator->Run(req);
    auto resp   = ToResponse(report);

    span.SetCount("threats.requested", static_cast<std::size_t>(req.threats_size()));
    span.SetCount("threats.final", report.statistics.final_count);
    refiner::observability::Metrics::Instance().RecordRpc(kRoute, true, ElapsedMs(started_at));
    return resp;
  } catch (const std::exception& ex) {
    span.Fail(ex.what());
    REFINER_LOG_ERROR("RPC failed", {refiner::observability::StringField("route", kRoute), refiner::observability::StringField("error", ex.what())});
    refiner::observability::Metrics::Instance().RecordRpc(kRoute, false, ElapsedMs(started_at));
    throw;
  }
}

} // namespace refiner::service
