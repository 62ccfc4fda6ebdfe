#include "http_vulnerability_feed.hpp"

#include <curl/curl.h>
#include <google/protobuf/util/json_util.h>

#include <mutex>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "refiner/v1.hpp"

namespace refiner::vuln {

namespace {

using refiner::observability::IntField;
using refiner::observability::StringField;

std::once_flag g_curl_init;

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

template <typename Message>
Message ParseJson(const std::string& body, std::string_view what) {
  Message                                    message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body, &message, options);
  if (!status.ok()) {
    throw util::FeedUnavailable(std::string(what) + ": malformed response: " + std::string(status.message()));
  }
  return message;
}

} // namespace

std::chrono::milliseconds HttpFeedOptions::NvdRequestInterval() const {
  if (nvd_request_interval) return *nvd_request_interval;
  return nvd_api_key.empty() ? std::chrono::milliseconds(6000) : std::chrono::milliseconds(600);
}

std::unordered_set<std::string> ParseKevCatalog(const std::string& body) {
  auto kev = ParseJson<refiner::feed::v1::KevCatalog>(body, "kev catalog");

  std::unordered_set<std::string> known_exploited;
  for (const auto& entry : kev.vulnerabilities()) {
    if (entry.cve_id().empty()) continue;
    known_exploited.insert(util::ToUpper(entry.cve_id()));
  }

  REFINER_LOG_DEBUG("loaded known-exploited catalog",
                    {StringField("version", kev.catalog_version()), IntField("entries", static_cast<std::int64_t>(known_exploited.size()))});
  return known_exploited;
}

NvdLookup ParseNvdResponse(const std::string& body, const std::string& cve_id) {
  auto nvd = ParseJson<refiner::feed::v1::NvdResponse>(body, "nvd");

  NvdLookup lookup;
  for (const auto& vulnerability : nvd.vulnerabilities()) {
    if (util::ToUpper(vulnerability.cve().id()) != cve_id) continue;
    lookup.listed    = true;
    lookup.published = util::ParseDate(vulnerability.cve().published());
    break;
  }
  return lookup;
}

HttpVulnerabilityFeed::HttpVulnerabilityFeed(HttpFeedOptions options, Sleeper sleeper)
    : options_(std::move(options)), sleeper_(std::move(sleeper)) {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

std::string HttpVulnerabilityFeed::Get(const std::string& url, bool with_api_key) const {
  CURL* curl = curl_easy_init();
  if (!curl) {
    throw util::FeedUnavailable("curl_easy_init failed");
  }

  std::string        body;
  struct curl_slist* headers = nullptr;
  headers                    = curl_slist_append(headers, "Accept: application/json");
  if (with_api_key && !options_.nvd_api_key.empty()) {
    headers = curl_slist_append(headers, ("apiKey: " + options_.nvd_api_key).c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "threat-refiner/0.1 (libcurl)");
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  CURLcode res       = curl_easy_perform(curl);
  long     http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    throw util::FeedUnavailable("GET " + url + ": " + curl_easy_strerror(res));
  }
  // file:// mirrors of the catalog report no status code
  if (http_code != 0 && (http_code < 200 || http_code >= 300)) {
    throw util::FeedUnavailable("GET " + url + ": HTTP " + std::to_string(http_code));
  }

  return body;
}

FeedBatch HttpVulnerabilityFeed::Fetch(const std::vector<std::string>& cve_ids) {
  FeedBatch batch;
  if (cve_ids.empty()) return batch;

  // without the catalog no id can be judged, so this failure is batch-wide
  const auto known_exploited = ParseKevCatalog(Get(options_.kev_catalog_url, false));

  const auto interval = options_.NvdRequestInterval();
  bool       first    = true;

  for (const auto& id : cve_ids) {
    if (!first && interval.count() > 0) sleeper_(interval);
    first = false;

    model::VulnerabilityRecord record;
    record.cve_id                     = id;
    record.in_known_exploited_catalog = known_exploited.contains(id);

    NvdLookup lookup;
    try {
      lookup = ParseNvdResponse(Get(options_.nvd_api_url + "?cveId=" + id, true), id);
    } catch (const util::FeedUnavailable& e) {
      REFINER_LOG_WARN("nvd lookup failed", {StringField("cve_id", id), StringField("error", e.what())});
      if (!record.in_known_exploited_catalog) {
        batch.failures.push_back({id, e.what()});
        continue;
      }
    }

    record.published_date = lookup.published;
    if (lookup.listed || record.in_known_exploited_catalog) {
      batch.records.push_back(std::move(record));
    }
  }

  return batch;
}

} // namespace refiner::vuln
