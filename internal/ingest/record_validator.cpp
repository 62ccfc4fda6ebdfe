#include "record_validator.hpp"

#include <cctype>
#include <cmath>
#include <set>
#include <unordered_set>

#include "internal/model/enum_parsing.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "refiner/v1.hpp"

namespace refiner::ingest {

namespace {

void PushUnique(std::vector<std::string>& values, std::string value) {
  for (const auto& existing : values) {
    if (existing == value) return;
  }
  values.push_back(std::move(value));
}

} // namespace

bool IsCveId(std::string_view text) {
  // CVE-YYYY-NNNN with at least four sequence digits
  if (text.size() < 13) return false;
  if (util::ToUpper(text.substr(0, 4)) != "CVE-") return false;
  for (std::size_t i = 4; i < 8; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  if (text[8] != '-') return false;
  for (std::size_t i = 9; i < text.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  return true;
}

double ScoreFromLabels(std::string_view impact, std::string_view likelihood) {
  const auto impact_label     = util::NormalizeText(impact);
  const auto likelihood_label = util::NormalizeText(likelihood);

  int impact_value = 0;
  if (impact_label == "critical") impact_value = 4;
  else if (impact_label == "high") impact_value = 3;
  else if (impact_label == "medium") impact_value = 2;
  else if (impact_label == "low") impact_value = 1;
  else throw util::InvalidInput("unknown impact label '" + std::string(impact) + "'");

  int likelihood_value = 0;
  if (likelihood_label == "high") likelihood_value = 3;
  else if (likelihood_label == "medium") likelihood_value = 2;
  else if (likelihood_label == "low") likelihood_value = 1;
  else throw util::InvalidInput("unknown likelihood label '" + std::string(likelihood) + "'");

  // 4 x 3 is the top of the matrix
  const double score = impact_value * likelihood_value * 10.0 / 12.0;
  return std::round(score * 100.0) / 100.0;
}

model::Threat RecordValidator::ValidateThreat(const refiner::v1::RawThreat& raw, std::size_t position) const {
  model::Threat threat;

  threat.id = util::Trim(raw.id());
  if (threat.id.empty()) threat.id = "T-" + std::to_string(position);

  threat.component_ref = util::Trim(raw.component_name());
  if (threat.component_ref.empty()) throw util::InvalidInput("component_name is required");

  auto category = model::ParseStrideCategory(raw.stride_category());
  if (!category) throw util::InvalidInput("unknown stride_category '" + raw.stride_category() + "'");
  threat.stride_category = *category;

  threat.description = util::Trim(raw.threat_description());
  if (threat.description.empty()) throw util::InvalidInput("threat_description is required");

  threat.mitigation_suggestion = util::Trim(raw.mitigation_suggestion());

  for (const auto& reference : raw.references()) {
    auto value = util::Trim(reference);
    if (value.empty()) continue;
    if (IsCveId(value)) {
      PushUnique(threat.cited_cves, util::ToUpper(value));
    } else {
      PushUnique(threat.other_references, std::move(value));
    }
  }

  if (raw.has_inherent_risk_score()) {
    const double score = raw.inherent_risk_score();
    if (!std::isfinite(score) || score < 0.0 || score > 10.0) {
      throw util::InvalidInput("inherent_risk_score out of range [0, 10]");
    }
    threat.inherent_risk_score = score;
  } else if (!raw.impact().empty() || !raw.likelihood().empty()) {
    threat.inherent_risk_score = ScoreFromLabels(raw.impact(), raw.likelihood());
  } else {
    throw util::InvalidInput("inherent_risk_score or impact/likelihood is required");
  }

  return threat;
}

model::Component RecordValidator::ValidateComponent(const refiner::v1::RawComponent& raw) const {
  model::Component component;

  component.canonical_name = util::Trim(raw.name());
  if (component.canonical_name.empty()) throw util::InvalidInput("component name is required");

  auto type = model::ParseComponentType(raw.type());
  if (!type) throw util::InvalidInput("unknown component type '" + raw.type() + "'");
  component.type = *type;

  component.description         = util::Trim(raw.description());
  component.data_classification = util::Trim(raw.data_classification());
  return component;
}

model::Control RecordValidator::ValidateControl(const refiner::v1::RawControl& raw) const {
  model::Control control;

  control.name = util::Trim(raw.name());
  if (control.name.empty()) throw util::InvalidInput("control name is required");

  control.category = util::Trim(raw.category());

  for (const auto& label : raw.coverage()) {
    auto category = model::ParseStrideCategory(label);
    if (!category) throw util::InvalidInput("unknown coverage category '" + label + "'");
    control.coverage.Insert(*category);
  }
  if (control.coverage.Empty()) throw util::InvalidInput("control covers no STRIDE category");

  for (const auto& target : raw.applies_to()) {
    auto name = util::Trim(target);
    if (name.empty()) continue;
    if (util::ToLower(name) == model::kGlobalScope) name = std::string(model::kGlobalScope);
    PushUnique(control.applies_to, std::move(name));
  }
  if (control.applies_to.empty()) throw util::InvalidInput("control applies to no component");

  return control;
}

IngestedBatch RecordValidator::Ingest(const refiner::v1::RefineThreatsRequest& request) const {
  using refiner::observability::IntField;
  using refiner::observability::StringField;

  IngestedBatch batch;

  auto reject = [&batch](std::string_view kind, std::string id, std::size_t position, std::string reason) {
    REFINER_LOG_WARN("rejected input record", {StringField("kind", kind), StringField("id", id),
                                               IntField("position", static_cast<std::int64_t>(position)), StringField("reason", reason)});
    batch.rejected.push_back(RejectedRecord{std::string(kind), std::move(id), position, std::move(reason)});
  };

  std::set<std::string> component_keys;
  std::size_t           position = 0;
  for (const auto& raw : request.components()) {
    ++position;
    try {
      auto component = ValidateComponent(raw);
      if (!component_keys.insert(util::NormalizeText(component.canonical_name)).second) {
        throw util::InvalidInput("duplicate component name");
      }
      batch.components.push_back(std::move(component));
    } catch (const util::InvalidInput& e) {
      reject("component", raw.name(), position, e.what());
    }
  }

  position = 0;
  for (const auto& raw : request.controls()) {
    ++position;
    try {
      batch.controls.push_back(ValidateControl(raw));
    } catch (const util::InvalidInput& e) {
      reject("control", raw.name(), position, e.what());
    }
  }

  std::unordered_set<std::string> threat_ids;
  position = 0;
  for (const auto& raw : request.threats()) {
    ++position;
    try {
      auto threat = ValidateThreat(raw, position);
      if (!threat_ids.insert(threat.id).second) {
        throw util::InvalidInput("duplicate threat id " + threat.id);
      }
      batch.threats.push_back(std::move(threat));
    } catch (const util::InvalidInput& e) {
      reject("threat", raw.id().empty() ? "T-" + std::to_string(position) : raw.id(), position, e.what());
    }
  }

  return batch;
}

} // namespace refiner::ingest
