#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

#include "internal/util/time.hpp"
#include "internal/vuln/vulnerability_feed.hpp"

namespace refiner::vuln {

struct HttpFeedOptions {
  // http(s):// or a file:// mirror
  std::string               kev_catalog_url = "https://www.cisa.gov/sites/default/files/feeds/known_exploited_vulnerabilities.json";
  std::string               nvd_api_url     = "https://services.nvd.nist.gov/rest/json/cves/2.0";
  std::string               nvd_api_key;
  std::chrono::milliseconds timeout{10000};
  // Pause between NVD requests. Unset follows the public rate limit:
  // 5 requests per 30s without a key, 50 per 30s with one.
  std::optional<std::chrono::milliseconds> nvd_request_interval;

  std::chrono::milliseconds NvdRequestInterval() const;
};

// Ids listed in a CISA known-exploited catalog document, upper-cased.
// Throws util::FeedUnavailable when the document does not parse.
std::unordered_set<std::string> ParseKevCatalog(const std::string& body);

struct NvdLookup {
  bool                      listed = false;
  std::optional<util::Date> published;
};

// Finds cve_id in an NVD CVE API 2.0 response.
// Throws util::FeedUnavailable when the document does not parse.
NvdLookup ParseNvdResponse(const std::string& body, const std::string& cve_id);

/*
  Live feed over libcurl.

  One Fetch downloads the CISA known-exploited catalog once, then asks
  the NVD CVE API 2.0 for each id (?cveId=...) to learn its published
  date, spacing requests by NvdRequestInterval(). Ids known to neither
  source are omitted.

  Only a catalog failure fails the whole Fetch. An NVD failure for one
  id lands in FeedBatch::failures, unless the catalog lists that id, in
  which case the record is still returned without a published date.
*/
class HttpVulnerabilityFeed final : public VulnerabilityFeed {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  explicit HttpVulnerabilityFeed(HttpFeedOptions options, Sleeper sleeper = {});

  std::string_view Name() const override {
    return "http";
  }

  FeedBatch Fetch(const std::vector<std::string>& cve_ids) override;

 private:
  std::string Get(const std::string& url, bool with_api_key) const;

  HttpFeedOptions options_;
  Sleeper         sleeper_;
};

} // namespace refiner::vuln
