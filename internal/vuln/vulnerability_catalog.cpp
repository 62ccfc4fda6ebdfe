#include "vulnerability_catalog.hpp"

#include <algorithm>
#include <set>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace refiner::vuln {

using refiner::observability::IntField;
using refiner::observability::StringField;

VulnerabilitySnapshot::VulnerabilitySnapshot(std::vector<model::VulnerabilityRecord> records) {
  for (auto& record : records) {
    auto id      = record.cve_id;
    records_[id] = std::move(record);
  }
}

const model::VulnerabilityRecord* VulnerabilitySnapshot::Find(const std::string& cve_id) const {
  auto it = records_.find(cve_id);
  return it == records_.end() ? nullptr : &it->second;
}

VulnerabilityCatalog::VulnerabilityCatalog(std::shared_ptr<VulnerabilityFeed>            feed,
                                           std::shared_ptr<db::VulnerabilityRepository> cache,
                                           CatalogOptions                                options,
                                           Sleeper                                       sleeper,
                                           ClockSource                                   clock)
    : feed_(std::move(feed)), cache_(std::move(cache)), options_(options), sleeper_(std::move(sleeper)), clock_(std::move(clock)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
  if (!clock_) {
    clock_ = [] { return util::Now(); };
  }
  if (options_.max_attempts == 0) {
    throw util::InvalidConfig("vulnerability.max_attempts must be at least 1");
  }
  if (options_.cache_retention < options_.cache_ttl) {
    throw util::InvalidConfig("vulnerability.cache_retention_hours must not be shorter than cache_ttl_hours");
  }
}

std::size_t VulnerabilityCatalog::PurgeRetired() {
  if (!cache_) return 0;

  const auto result = cache_->PurgeFetchedBefore(clock_() - options_.cache_retention);
  if (!result) {
    REFINER_LOG_WARN("vulnerability cache purge failed", {StringField("code", db::ToString(result.code)), StringField("error", result.message)});
    return 0;
  }

  REFINER_LOG_INFO("purged retired vulnerability records", {IntField("removed", static_cast<std::int64_t>(result.affected)),
                                                           IntField("retention_hours", options_.cache_retention.count())});
  return result.affected;
}

std::optional<FeedBatch> VulnerabilityCatalog::FetchWithRetry(const std::vector<std::string>& cve_ids, std::string& last_error) {
  auto backoff = options_.initial_backoff;

  for (std::uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    try {
      return feed_->Fetch(cve_ids);
    } catch (const util::FeedUnavailable& e) {
      last_error = e.what();
      REFINER_LOG_WARN("vulnerability feed fetch failed",
                       {StringField("feed", feed_->Name()), IntField("attempt", attempt), StringField("error", e.what())});
    }

    if (attempt < options_.max_attempts) {
      sleeper_(backoff);
      backoff *= 2;
    }
  }

  return std::nullopt;
}

Resolution VulnerabilityCatalog::Resolve(const std::vector<std::string>& cve_ids) {
  Resolution resolution;

  const std::set<std::string> unique(cve_ids.begin(), cve_ids.end());
  if (unique.empty()) return resolution;

  const auto now = clock_();

  std::vector<model::VulnerabilityRecord> resolved;
  std::vector<model::VulnerabilityRecord> expired;
  std::vector<std::string>                missing;

  for (const auto& id : unique) {
    std::optional<model::VulnerabilityRecord> cached;
    if (cache_) cached = cache_->Get(id);

    if (cached && now - cached->fetched_at < options_.cache_ttl) {
      resolved.push_back(std::move(*cached));
      ++resolution.cache_hits;
      continue;
    }

    if (cached) expired.push_back(std::move(*cached));
    missing.push_back(id);
  }

  if (!missing.empty()) {
    std::optional<FeedBatch> batch;
    std::string              last_error = "no vulnerability feed configured";

    if (feed_) batch = FetchWithRetry(missing, last_error);

    std::set<std::string> answered;
    std::set<std::string> failed;

    if (batch) {
      for (auto& record : batch->records) {
        if (!std::binary_search(missing.begin(), missing.end(), record.cve_id)) continue;
        if (!answered.insert(record.cve_id).second) continue;
        record.fetched_at = now;

        if (cache_) {
          auto result = cache_->Upsert(record);
          if (!result) {
            REFINER_LOG_WARN("vulnerability cache write failed", {StringField("cve_id", record.cve_id), StringField("code", db::ToString(result.code)),
                                                                   StringField("error", result.message)});
          }
        }

        resolved.push_back(std::move(record));
        ++resolution.fetched;
      }

      for (const auto& failure : batch->failures) {
        if (!std::binary_search(missing.begin(), missing.end(), failure.cve_id) || answered.contains(failure.cve_id)) continue;
        if (failed.insert(failure.cve_id).second && failed.size() == 1) last_error = failure.error;
      }
    } else {
      failed.insert(missing.begin(), missing.end());
    }

    std::size_t reused = 0;
    for (auto& record : expired) {
      if (!failed.contains(record.cve_id)) continue;
      resolved.push_back(std::move(record));
      ++reused;
    }

    resolution.failed       = failed.size();
    resolution.served_stale = reused;
    resolution.unresolved   = missing.size() - answered.size() - reused;

    if (!failed.empty()) {
      resolution.feed_degraded = true;

      const auto cause = batch ? "vulnerability feed could not look up " + std::to_string(failed.size()) + " CVE(s) (" + last_error + ")"
                               : "vulnerability feed unavailable (" + last_error + ")";
      resolution.warnings.push_back(cause + "; " + std::to_string(failed.size() - reused) + " CVE(s) have unknown relevance" +
                                    (reused > 0 ? ", " + std::to_string(reused) + " served from expired cache" : std::string{}));
    }
  }

  REFINER_LOG_INFO("resolved vulnerability records",
                   {IntField("requested", static_cast<std::int64_t>(unique.size())),
                    IntField("cache_hits", static_cast<std::int64_t>(resolution.cache_hits)),
                    IntField("fetched", static_cast<std::int64_t>(resolution.fetched)),
                    IntField("failed", static_cast<std::int64_t>(resolution.failed)),
                    IntField("unresolved", static_cast<std::int64_t>(resolution.unresolved))});

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordCveLookups("cache", resolution.cache_hits);
  metrics.RecordCveLookups("feed", resolution.fetched);
  metrics.RecordCveLookups("stale", resolution.served_stale);
  metrics.RecordCveLookups("unknown", resolution.unresolved);

  resolution.snapshot = VulnerabilitySnapshot(std::move(resolved));
  return resolution;
}

} // namespace refiner::vuln
