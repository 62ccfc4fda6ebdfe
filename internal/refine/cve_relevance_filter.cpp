#include "cve_relevance_filter.hpp"

#include "internal/refine/transitions.hpp"

namespace refiner::refine {

CveRelevanceFilter::CveRelevanceFilter(const vuln::VulnerabilitySnapshot& snapshot, util::Date as_of, int staleness_years)
    : snapshot_(snapshot), as_of_(as_of), staleness_years_(staleness_years) {
}

model::CveAssessment CveRelevanceFilter::Assess(const std::string& cve_id) const {
  model::CveAssessment assessment;
  assessment.cve_id = cve_id;

  const auto* record = snapshot_.Find(cve_id);
  if (!record) return assessment;

  assessment.known_exploited = record->in_known_exploited_catalog;

  if (record->in_known_exploited_catalog) {
    assessment.relevance = model::CveRelevance::kRelevant;
  } else if (!record->published_date) {
    assessment.relevance = model::CveRelevance::kUnknown;
  } else if (util::AddYears(*record->published_date, staleness_years_) < as_of_) {
    assessment.relevance = model::CveRelevance::kStale;
  } else {
    assessment.relevance = model::CveRelevance::kRelevant;
  }
  return assessment;
}

bool CveRelevanceFilter::Apply(model::Threat& threat) const {
  if (!threat.IsActive()) return false;

  threat.cve_assessments.clear();
  for (const auto& cve : threat.cited_cves) {
    threat.cve_assessments.push_back(Assess(cve));
  }

  if (threat.cve_assessments.empty() || !threat.other_references.empty()) return false;

  for (const auto& assessment : threat.cve_assessments) {
    if (assessment.relevance != model::CveRelevance::kStale) return false;
  }

  Suppress(threat, "stale_cve");
  return true;
}

} // namespace refiner::refine
