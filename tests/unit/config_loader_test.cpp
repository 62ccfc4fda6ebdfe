#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/refinement_config.hpp"
#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "threat_refiner_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
vulnerability:
  sqlite_cache:
    path: "C:\\refiner\\\"quoted\"\\cache.sqlite"
)");

  auto config = refiner::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.vulnerability().sqlite_cache().path() == "C:\\refiner\\\"quoted\"\\cache.sqlite");
}

void TestQuotedDatesStayStrings() {
  auto config = refiner::config::ConfigLoader::LoadFromYamlString(R"(vulnerability:
  static_records:
    records:
      - cve_id: CVE-2014-0160
        published_date: "2014-04-07"
        in_known_exploited_catalog: true
)");

  assert(config.vulnerability().has_static_records());
  assert(config.vulnerability().static_records().records_size() == 1);
  const auto& record = config.vulnerability().static_records().records(0);
  assert(record.cve_id() == "CVE-2014-0160");
  assert(record.published_date() == "2014-04-07");
  assert(record.in_known_exploited_catalog());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
dedup:
  similarity_threshold: 0.85
)");

  bool threw = false;
  try {
    (void)refiner::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config     = refiner::config::ConfigLoader::LoadFromYamlString("");
  auto refinement = refiner::config::BuildRefinementConfig(config);

  assert(refinement.worker_threads == 4);
  assert(refinement.acceptance_threshold == 0.6);
  assert(refinement.suppress_matching_controls);
  assert(refinement.cve_staleness_years == 5);
  assert(refinement.similarity_threshold == 0.85);
  assert(refinement.require_same_component);
  assert(refinement.risk.maturity_strong == 0.4);
  assert(refinement.default_industry == refiner::model::Industry::kGeneric);
  assert(!refinement.quality.enabled);
}

void TestExplicitZeroOverridesDefault() {
  auto config = refiner::config::ConfigLoader::LoadFromYamlString(R"(pipeline:
  worker_threads: 0
controls:
  suppress_matches: false
statements:
  default_industry: Healthcare
  templates:
    - stride_category: Spoofing
      industry: Healthcare
      text: "Impersonation at {component}"
)");
  auto refinement = refiner::config::BuildRefinementConfig(config);

  assert(refinement.worker_threads == 0);
  assert(!refinement.suppress_matching_controls);
  assert(refinement.default_industry == refiner::model::Industry::kHealthcare);
  assert(refinement.templates.size() == 1);
  assert(refinement.templates[0].stride_category == refiner::model::StrideCategory::kSpoofing);
  assert(refinement.templates[0].industry == refiner::model::Industry::kHealthcare);
}

void TestNonMonotonicRiskFactorsAreRejected() {
  auto config = refiner::config::ConfigLoader::LoadFromYamlString(R"(risk:
  maturity_partial: 0.3
  maturity_strong: 0.5
)");

  bool threw = false;
  try {
    (void)refiner::config::BuildRefinementConfig(config);
  } catch (const refiner::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestOutOfRangeThresholdIsRejected() {
  auto config = refiner::config::ConfigLoader::LoadFromYamlString(R"(dedup:
  similarity_threshold: 1.5
)");

  bool threw = false;
  try {
    (void)refiner::config::BuildRefinementConfig(config);
  } catch (const refiner::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownTemplateCategoryIsRejected() {
  auto config = refiner::config::ConfigLoader::LoadFromYamlString(R"(statements:
  templates:
    - stride_category: Phishing
      text: "x"
)");

  bool threw = false;
  try {
    (void)refiner::config::BuildRefinementConfig(config);
  } catch (const refiner::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedDatesStayStrings();
  TestUnknownFieldsAreRejected();
  TestEmptyDocumentYieldsDefaults();
  TestExplicitZeroOverridesDefault();
  TestNonMonotonicRiskFactorsAreRejected();
  TestOutOfRangeThresholdIsRejected();
  TestUnknownTemplateCategoryIsRejected();

  std::cout << "threat_refiner_unit_config_loader: pass\n";
  return 0;
}
