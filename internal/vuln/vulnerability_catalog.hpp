#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/vulnerability_repository.hpp"
#include "internal/util/time.hpp"
#include "internal/vuln/vulnerability_feed.hpp"

namespace refiner::vuln {

struct CatalogOptions {
  std::chrono::hours        cache_ttl{24};
  // expired records stay this long as the fallback for an unreachable feed
  std::chrono::hours        cache_retention{24 * 30};
  std::uint32_t             max_attempts = 3;
  std::chrono::milliseconds initial_backoff{200};
};

/*
  Read-only view of the records resolved for one run.
  Ids absent from the snapshot have unknown relevance.
*/
class VulnerabilitySnapshot {
 public:
  VulnerabilitySnapshot() = default;
  explicit VulnerabilitySnapshot(std::vector<model::VulnerabilityRecord> records);

  const model::VulnerabilityRecord* Find(const std::string& cve_id) const;

  std::size_t Size() const {
    return records_.size();
  }

 private:
  std::unordered_map<std::string, model::VulnerabilityRecord> records_;
};

struct Resolution {
  VulnerabilitySnapshot    snapshot;
  std::vector<std::string> warnings;
  std::size_t              cache_hits    = 0;
  std::size_t              fetched       = 0;
  std::size_t              unresolved    = 0;
  std::size_t              failed        = 0; // feed lookups that errored
  std::size_t              served_stale  = 0; // expired cache entries used for failed lookups
  bool                     feed_degraded = false;
};

/*
  Resolves CVE ids through the persistent cache and the feed.

  Fresh cache entries (fetched within cache_ttl) are served directly.
  Missing or expired ids are fetched in one batch with bounded retry and
  exponential backoff. When the feed stays unavailable, or fails for
  individual ids, expired cache entries are used as-is for the failed
  ids and the remaining ones stay unknown; Resolve never throws for feed
  or cache failures. Per-id failures are not retried.
*/
class VulnerabilityCatalog {
 public:
  using Sleeper     = std::function<void(std::chrono::milliseconds)>;
  using ClockSource = std::function<util::TimePoint()>;

  VulnerabilityCatalog(std::shared_ptr<VulnerabilityFeed>            feed,
                       std::shared_ptr<db::VulnerabilityRepository> cache,
                       CatalogOptions                                options = {},
                       Sleeper                                       sleeper = {},
                       ClockSource                                   clock   = {});

  Resolution Resolve(const std::vector<std::string>& cve_ids);

  // Drops cache records fetched before now - cache_retention. Returns
  // the number removed; a cache failure is logged and reported as 0.
  std::size_t PurgeRetired();

 private:
  std::optional<FeedBatch> FetchWithRetry(const std::vector<std::string>& cve_ids, std::string& last_error);

  std::shared_ptr<VulnerabilityFeed>            feed_;
  std::shared_ptr<db::VulnerabilityRepository> cache_;
  CatalogOptions                                options_;
  Sleeper                                       sleeper_;
  ClockSource                                   clock_;
};

} // namespace refiner::vuln
