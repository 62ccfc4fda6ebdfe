#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace refiner::model {

/*
  Third-party intelligence for one CVE.

  published_date is absent when the feed knows the CVE only through the
  known-exploited catalog.
*/
struct VulnerabilityRecord {
  std::string                          cve_id;
  std::optional<std::chrono::sys_days> published_date;
  bool                                 in_known_exploited_catalog = false;

  std::chrono::system_clock::time_point fetched_at{};
};

} // namespace refiner::model
