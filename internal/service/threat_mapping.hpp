#pragma once

#include "internal/core/refinement_orchestrator.hpp"
#include "refiner/v1.hpp"

namespace refiner::service {

/*
  Model <-> wire conversions for the refinement API.
*/

refiner::v1::StrideCategory     ToProto(model::StrideCategory category);
refiner::v1::ThreatStatus       ToProto(model::ThreatStatus status);
refiner::v1::Exploitability     ToProto(model::Exploitability exploitability);
refiner::v1::MitigationMaturity ToProto(model::MitigationMaturity maturity);
refiner::v1::CveRelevance       ToProto(model::CveRelevance relevance);

refiner::v1::RefinedThreat        ToProto(const model::Threat& threat);
refiner::v1::RejectedRecord       ToProto(const ingest::RejectedRecord& record);
refiner::v1::RefinementStatistics ToProto(const core::RefinementStatistics& statistics);

refiner::v1::RefineThreatsResponse ToResponse(const core::RefinementReport& report);

} // namespace refiner::service
