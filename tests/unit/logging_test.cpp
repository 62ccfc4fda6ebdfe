#include "internal/observability/logging.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using refiner::observability::FormatFields;
using refiner::observability::IntField;
using refiner::observability::ParseLevel;
using refiner::observability::StringField;

void TestFieldsAreQuotedWhenNeeded() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("cve_id", "CVE-2021-44228"), IntField("attempt", 2)}) == "cve_id=CVE-2021-44228 attempt=2");
  assert(FormatFields({StringField("error", "GET https://nvd: HTTP 503")}) == R"(error="GET https://nvd: HTTP 503")");
  assert(FormatFields({StringField("name", "say \"hi\"")}) == R"(name="say \"hi\"")");
  assert(FormatFields({StringField("path", "")}) == R"(path="")");
}

void TestLevelNames() {
  assert(ParseLevel("debug") == spdlog::level::debug);
  assert(ParseLevel("warn") == spdlog::level::warn);
  assert(ParseLevel("off") == spdlog::level::off);

  bool threw = false;
  try {
    (void)ParseLevel("verbose");
  } catch (const refiner::util::InvalidConfig& e) {
    threw = std::string(e.what()).find("verbose") != std::string::npos;
  }
  assert(threw);
}

void TestLogLineCarriesFields() {
  std::ostringstream captured;
  auto               logger = std::make_shared<spdlog::logger>("capture", std::make_shared<spdlog::sinks::ostream_sink_st>(captured));
  logger->set_pattern("%l %v");
  logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(logger);

  REFINER_LOG_DEBUG("hidden below the level");
  REFINER_LOG_WARN("vulnerability feed fetch failed", {StringField("feed", "http"), IntField("attempt", 1)});
  REFINER_LOG_INFO("braces {} pass through");
  logger->flush();

  const auto text = captured.str();
  assert(text.find("hidden") == std::string::npos);
  assert(text.find("warning vulnerability feed fetch failed feed=http attempt=1\n") != std::string::npos);
  assert(text.find("info braces {} pass through\n") != std::string::npos);
}

} // namespace

int main() {
  TestFieldsAreQuotedWhenNeeded();
  TestLevelNames();
  TestLogLineCarriesFields();

  std::cout << "threat_refiner_unit_logging: pass\n";
  return 0;
}
