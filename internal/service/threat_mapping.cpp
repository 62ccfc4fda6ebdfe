#include "threat_mapping.hpp"

namespace refiner::service {

using namespace refiner::v1;

refiner::v1::StrideCategory ToProto(model::StrideCategory category) {
  switch (category) {
    case model::StrideCategory::kSpoofing:
      return STRIDE_CATEGORY_SPOOFING;
    case model::StrideCategory::kTampering:
      return STRIDE_CATEGORY_TAMPERING;
    case model::StrideCategory::kRepudiation:
      return STRIDE_CATEGORY_REPUDIATION;
    case model::StrideCategory::kInformationDisclosure:
      return STRIDE_CATEGORY_INFORMATION_DISCLOSURE;
    case model::StrideCategory::kDenialOfService:
      return STRIDE_CATEGORY_DENIAL_OF_SERVICE;
    case model::StrideCategory::kElevationOfPrivilege:
      return STRIDE_CATEGORY_ELEVATION_OF_PRIVILEGE;
  }
  return STRIDE_CATEGORY_UNSPECIFIED;
}

refiner::v1::ThreatStatus ToProto(model::ThreatStatus status) {
  switch (status) {
    case model::ThreatStatus::kActive:
      return THREAT_STATUS_ACTIVE;
    case model::ThreatStatus::kSuppressed:
      return THREAT_STATUS_SUPPRESSED;
    case model::ThreatStatus::kMerged:
      return THREAT_STATUS_MERGED;
  }
  return THREAT_STATUS_UNSPECIFIED;
}

refiner::v1::Exploitability ToProto(model::Exploitability exploitability) {
  switch (exploitability) {
    case model::Exploitability::kLow:
      return EXPLOITABILITY_LOW;
    case model::Exploitability::kMedium:
      return EXPLOITABILITY_MEDIUM;
    case model::Exploitability::kHigh:
      return EXPLOITABILITY_HIGH;
  }
  return EXPLOITABILITY_UNSPECIFIED;
}

refiner::v1::MitigationMaturity ToProto(model::MitigationMaturity maturity) {
  switch (maturity) {
    case model::MitigationMaturity::kNone:
      return MITIGATION_MATURITY_NONE;
    case model::MitigationMaturity::kPartial:
      return MITIGATION_MATURITY_PARTIAL;
    case model::MitigationMaturity::kStrong:
      return MITIGATION_MATURITY_STRONG;
  }
  return MITIGATION_MATURITY_UNSPECIFIED;
}

refiner::v1::CveRelevance ToProto(model::CveRelevance relevance) {
  switch (relevance) {
    case model::CveRelevance::kRelevant:
      return CVE_RELEVANCE_RELEVANT;
    case model::CveRelevance::kStale:
      return CVE_RELEVANCE_STALE;
    case model::CveRelevance::kUnknown:
      break;
  }
  return CVE_RELEVANCE_UNKNOWN;
}

RefinedThreat ToProto(const model::Threat& threat) {
  RefinedThreat out;
  out.set_id(threat.id);
  out.set_component_ref(threat.component_ref);
  if (threat.canonical_component) out.set_canonical_component(*threat.canonical_component);
  out.set_unmatched_component(threat.unmatched_component);
  out.set_match_score(threat.match_score);

  out.set_stride_category(ToProto(threat.stride_category));
  out.set_description(threat.description);
  out.set_mitigation_suggestion(threat.mitigation_suggestion);
  for (const auto& mitigation : threat.additional_mitigations) out.add_additional_mitigations(mitigation);

  for (const auto& cve : threat.cited_cves) out.add_cited_cves(cve);
  for (const auto& reference : threat.other_references) out.add_other_references(reference);
  out.set_inherent_risk_score(threat.inherent_risk_score);

  out.set_status(ToProto(threat.status));
  if (threat.suppressed_reason) out.set_suppressed_reason(*threat.suppressed_reason);
  if (threat.cluster_id) out.set_cluster_id(*threat.cluster_id);
  if (threat.merged_into) out.set_merged_into(*threat.merged_into);
  for (const auto& id : threat.merged_from) out.add_merged_from(id);

  for (const auto& assessment : threat.cve_assessments) {
    auto* entry = out.add_cve_assessments();
    entry->set_cve_id(assessment.cve_id);
    entry->set_relevance(ToProto(assessment.relevance));
    entry->set_known_exploited(assessment.known_exploited);
  }

  if (threat.risk) {
    auto* risk = out.mutable_risk();
    risk->set_exploitability(ToProto(threat.risk->exploitability));
    risk->set_mitigation_maturity(ToProto(threat.risk->mitigation_maturity));
    risk->set_residual_risk(threat.risk->residual_risk);
    risk->set_severity_band(threat.risk->severity_band);
    risk->set_business_impact_statement(threat.risk->business_impact_statement);
    risk->set_risk_statement(threat.risk->risk_statement);
    risk->set_justification(threat.risk->justification);
  }

  return out;
}

RejectedRecord ToProto(const ingest::RejectedRecord& record) {
  RejectedRecord out;
  out.set_kind(record.kind);
  out.set_id(record.id);
  out.set_position(static_cast<uint32_t>(record.position));
  out.set_reason(record.reason);
  return out;
}

RefinementStatistics ToProto(const core::RefinementStatistics& s) {
  RefinementStatistics out;
  out.set_original_count(static_cast<uint32_t>(s.original_count));
  out.set_rejected_count(static_cast<uint32_t>(s.rejected_count));
  out.set_suppressed_by_control(static_cast<uint32_t>(s.suppressed_by_control));
  out.set_suppressed_stale_cve(static_cast<uint32_t>(s.suppressed_stale_cve));
  out.set_suppressed_low_quality(static_cast<uint32_t>(s.suppressed_low_quality));
  out.set_merged_count(static_cast<uint32_t>(s.merged_count));
  out.set_cluster_count(static_cast<uint32_t>(s.cluster_count));
  out.set_final_count(static_cast<uint32_t>(s.final_count));
  out.set_unmatched_component_count(static_cast<uint32_t>(s.unmatched_component_count));
  out.set_critical_count(static_cast<uint32_t>(s.critical_count));
  out.set_high_count(static_cast<uint32_t>(s.high_count));
  out.set_medium_count(static_cast<uint32_t>(s.medium_count));
  out.set_low_count(static_cast<uint32_t>(s.low_count));
  return out;
}

RefineThreatsResponse ToResponse(const core::RefinementReport& report) {
  RefineThreatsResponse resp;
  for (const auto& threat : report.threats) *resp.add_threats() = ToProto(threat);
  for (const auto& rejected : report.rejected) *resp.add_rejected() = ToProto(rejected);
  for (const auto& warning : report.warnings) resp.add_warnings(warning);
  *resp.mutable_statistics() = ToProto(report.statistics);
  return resp;
}

} // namespace refiner::service
