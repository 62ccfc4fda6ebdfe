#pragma once

#include "internal/model/threat.hpp"
#include "internal/util/time.hpp"
#include "internal/vuln/vulnerability_catalog.hpp"

namespace refiner::refine {

/*
  Judges the CVEs an active threat cites against the run's vulnerability
  snapshot.

  A CVE is stale when it was published more than staleness_years before
  as_of and is not known-exploited. A CVE without a record (or without a
  published date) is unknown, never stale. A threat is suppressed as
  "stale_cve" only when every cited CVE is stale and it carries no other
  references.
*/
class CveRelevanceFilter {
 public:
  CveRelevanceFilter(const vuln::VulnerabilitySnapshot& snapshot, util::Date as_of, int staleness_years);

  model::CveAssessment Assess(const std::string& cve_id) const;

  // Records cve_assessments; returns true when the threat was suppressed.
  bool Apply(model::Threat& threat) const;

 private:
  const vuln::VulnerabilitySnapshot& snapshot_;
  util::Date                         as_of_;
  int                                staleness_years_;
};

} // namespace refiner::refine
