#include "internal/vuln/http_vulnerability_feed.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using refiner::vuln::HttpFeedOptions;
using refiner::vuln::HttpVulnerabilityFeed;
using refiner::vuln::ParseKevCatalog;
using refiner::vuln::ParseNvdResponse;

const std::string kKevCatalog = R"({
  "title": "CISA Catalog of Known Exploited Vulnerabilities",
  "catalogVersion": "2024.06.03",
  "dateReleased": "2024-06-03T16:00:02.9917Z",
  "count": 2,
  "vulnerabilities": [
    {
      "cveID": "CVE-2021-44228",
      "vendorProject": "Apache",
      "product": "Log4j2",
      "dateAdded": "2021-12-10",
      "knownRansomwareCampaignUse": "Known",
      "cwes": ["CWE-20", "CWE-400"]
    },
    {
      "cveID": "cve-2014-0160",
      "vendorProject": "OpenSSL",
      "dateAdded": "2022-05-04"
    }
  ]
})";

const std::string kNvdHeartbleed = R"({
  "resultsPerPage": 1,
  "startIndex": 0,
  "totalResults": 1,
  "format": "NVD_CVE",
  "version": "2.0",
  "timestamp": "2024-06-03T16:20:11.300",
  "vulnerabilities": [
    {
      "cve": {
        "id": "CVE-2014-0160",
        "sourceIdentifier": "secalert@redhat.com",
        "published": "2014-04-07T22:55:03.893",
        "lastModified": "2024-05-14T18:03:04.287",
        "vulnStatus": "Modified",
        "descriptions": [{"lang": "en", "value": "The TLS heartbeat extension ..."}],
        "metrics": {"cvssMetricV31": [{"cvssData": {"baseScore": 7.5}}]}
      }
    }
  ]
})";

template <typename Fn>
bool ThrowsFeedUnavailable(Fn&& fn) {
  try {
    fn();
  } catch (const refiner::util::FeedUnavailable&) {
    return true;
  }
  return false;
}

void TestKevCatalogIds() {
  const auto ids = ParseKevCatalog(kKevCatalog);
  assert(ids.size() == 2);
  assert(ids.contains("CVE-2021-44228"));
  assert(ids.contains("CVE-2014-0160"));
}

void TestNvdPublishedDate() {
  const auto lookup = ParseNvdResponse(kNvdHeartbleed, "CVE-2014-0160");
  assert(lookup.listed);
  assert(lookup.published.has_value());
  assert(refiner::util::FormatDate(*lookup.published) == "2014-04-07");

  const auto other = ParseNvdResponse(kNvdHeartbleed, "CVE-2021-44228");
  assert(!other.listed);
  assert(!other.published.has_value());

  const auto empty = ParseNvdResponse(R"({"resultsPerPage":0,"totalResults":0,"vulnerabilities":[]})", "CVE-2014-0160");
  assert(!empty.listed);
}

void TestMalformedDocumentsAreFeedFailures() {
  assert(ThrowsFeedUnavailable([] { (void)ParseKevCatalog("<html>429 Too Many Requests</html>"); }));
  assert(ThrowsFeedUnavailable([] { (void)ParseKevCatalog(R"({"vulnerabilities": "none"})"); }));
  assert(ThrowsFeedUnavailable([] { (void)ParseNvdResponse(R"({"vulnerabilities": [)", "CVE-2014-0160"); }));
}

void TestRequestIntervalFollowsRateLimit() {
  HttpFeedOptions options;
  assert(options.NvdRequestInterval() == 6000ms);

  options.nvd_api_key = "key";
  assert(options.NvdRequestInterval() == 600ms);

  options.nvd_request_interval = 0ms;
  assert(options.NvdRequestInterval() == 0ms);
}

void TestNvdOutageKeepsCatalogAnswers() {
  const auto kev_path = std::filesystem::temp_directory_path() /
                        ("threat_refiner_kev_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".json");
  {
    std::ofstream out(kev_path);
    out << kKevCatalog;
  }

  HttpFeedOptions options;
  options.kev_catalog_url = "file://" + kev_path.string();
  options.nvd_api_url     = "file:///nonexistent-threat-refiner-nvd/cves";
  options.timeout         = 2000ms;

  std::vector<std::chrono::milliseconds> sleeps;
  HttpVulnerabilityFeed feed(options, [&sleeps](std::chrono::milliseconds delay) { sleeps.push_back(delay); });

  const auto batch = feed.Fetch({"CVE-2021-44228", "CVE-2020-9999", "CVE-2014-0160"});

  // listed in the catalog: still relevant, published date unknown
  assert(batch.records.size() == 2);
  assert(batch.records[0].cve_id == "CVE-2021-44228");
  assert(batch.records[0].in_known_exploited_catalog);
  assert(!batch.records[0].published_date.has_value());
  assert(batch.records[1].cve_id == "CVE-2014-0160");

  assert(batch.failures.size() == 1);
  assert(batch.failures[0].cve_id == "CVE-2020-9999");
  assert(!batch.failures[0].error.empty());

  // one pause between each pair of NVD requests
  assert(sleeps.size() == 2);
  assert(sleeps[0] == 6000ms);

  std::filesystem::remove(kev_path);
}

void TestCatalogOutageFailsTheBatch() {
  HttpFeedOptions options;
  options.kev_catalog_url      = "file:///nonexistent-threat-refiner-kev/catalog.json";
  options.nvd_request_interval = 0ms;

  HttpVulnerabilityFeed feed(options, [](std::chrono::milliseconds) {});
  assert(ThrowsFeedUnavailable([&feed] { (void)feed.Fetch({"CVE-2021-44228"}); }));
  assert(feed.Fetch({}).records.empty());
}

} // namespace

int main() {
  TestKevCatalogIds();
  TestNvdPublishedDate();
  TestMalformedDocumentsAreFeedFailures();
  TestRequestIntervalFollowsRateLimit();
  TestNvdOutageKeepsCatalogAnswers();
  TestCatalogOutageFailsTheBatch();

  std::cout << "threat_refiner_unit_http_vulnerability_feed: pass\n";
  return 0;
}
