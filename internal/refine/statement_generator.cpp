#include "statement_generator.hpp"

#include <iomanip>
#include <sstream>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace refiner::refine {

namespace {

using model::Industry;
using model::StrideCategory;

struct DefaultTemplate {
  StrideCategory          category;
  std::optional<Industry> industry;
  std::string_view        text;
};

// clang-format off
constexpr DefaultTemplate kDefaultTemplates[] = {
    {StrideCategory::kSpoofing, std::nullopt,
     "{severity} risk ({residual_risk}/10): identity spoofing against {component}. {business_impact}"},
    {StrideCategory::kTampering, std::nullopt,
     "{severity} risk ({residual_risk}/10): unauthorized modification of {component}. {business_impact}"},
    {StrideCategory::kRepudiation, std::nullopt,
     "{severity} risk ({residual_risk}/10): actions on {component} cannot be reliably attributed. {business_impact}"},
    {StrideCategory::kInformationDisclosure, std::nullopt,
     "{severity} risk ({residual_risk}/10): information exposure from {component}. {business_impact}"},
    {StrideCategory::kDenialOfService, std::nullopt,
     "{severity} risk ({residual_risk}/10): loss of availability of {component}. {business_impact}"},
    {StrideCategory::kElevationOfPrivilege, std::nullopt,
     "{severity} risk ({residual_risk}/10): privilege escalation through {component}. {business_impact}"},

    {StrideCategory::kSpoofing, Industry::kFinance,
     "{severity} risk ({residual_risk}/10): account takeover via {component} could enable fraudulent transactions. {business_impact}"},
    {StrideCategory::kTampering, Industry::kFinance,
     "{severity} risk ({residual_risk}/10): manipulation of {component} could alter transaction amounts or ledgers. {business_impact}"},
    {StrideCategory::kInformationDisclosure, Industry::kFinance,
     "{severity} risk ({residual_risk}/10): exposure of cardholder or account data through {component} invites regulatory fines and customer loss. {business_impact}"},
    {StrideCategory::kDenialOfService, Industry::kFinance,
     "{severity} risk ({residual_risk}/10): outage of {component} would stop payment processing and revenue. {business_impact}"},

    {StrideCategory::kTampering, Industry::kHealthcare,
     "{severity} risk ({residual_risk}/10): altered records in {component} could lead to incorrect clinical decisions. {business_impact}"},
    {StrideCategory::kInformationDisclosure, Industry::kHealthcare,
     "{severity} risk ({residual_risk}/10): disclosure of patient information through {component} is a reportable privacy breach. {business_impact}"},
    {StrideCategory::kDenialOfService, Industry::kHealthcare,
     "{severity} risk ({residual_risk}/10): unavailability of {component} could delay patient care. {business_impact}"},

    {StrideCategory::kRepudiation, Industry::kGovernment,
     "{severity} risk ({residual_risk}/10): missing accountability on {component} weakens audit and oversight obligations. {business_impact}"},
    {StrideCategory::kInformationDisclosure, Industry::kGovernment,
     "{severity} risk ({residual_risk}/10): leakage of citizen or classified data through {component} erodes public trust. {business_impact}"},
    {StrideCategory::kElevationOfPrivilege, Industry::kGovernment,
     "{severity} risk ({residual_risk}/10): privilege escalation through {component} could compromise public services. {business_impact}"},
};
// clang-format on

std::string FormatScore(double value) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(1) << value;
  return os.str();
}

} // namespace

StatementGenerator::StatementGenerator(model::Industry                             industry,
                                       const std::vector<config::TemplateOverride>& overrides,
                                       const std::vector<model::Component>&         components)
    : industry_(industry), components_(components) {
  for (const auto& entry : kDefaultTemplates) {
    templates_[Key{entry.category, entry.industry}] = std::string(entry.text);
  }
  for (const auto& entry : overrides) {
    templates_[Key{entry.stride_category, entry.industry}] = entry.text;
  }
}

const std::string& StatementGenerator::TemplateFor(model::StrideCategory category) const {
  auto it = templates_.find(Key{category, industry_});
  if (it != templates_.end()) return it->second;

  it = templates_.find(Key{category, std::nullopt});
  if (it == templates_.end()) {
    throw util::InvariantViolation("statement: no generic template for " + std::string(model::ToString(category)));
  }
  return it->second;
}

std::string StatementGenerator::Render(const model::Threat& threat) const {
  if (!threat.risk) {
    throw util::InvariantViolation("statement: threat " + threat.id + " has no risk assessment; risk must run first");
  }

  const std::map<std::string, std::string> values = {
      {"component", threat.ComponentName()},
      {"residual_risk", FormatScore(threat.risk->residual_risk)},
      {"severity", threat.risk->severity_band},
      {"business_impact", threat.risk->business_impact_statement},
      {"description", threat.description},
  };

  auto statement = util::Interpolate(TemplateFor(threat.stride_category), values);

  const model::Component* component = nullptr;
  for (const auto& candidate : components_) {
    if (threat.canonical_component && candidate.canonical_name == *threat.canonical_component) component = &candidate;
  }

  if (component) {
    const auto classification = util::ToLower(component->data_classification);
    if (industry_ == Industry::kFinance && classification == "pci") {
      statement += " This may result in PCI-DSS compliance violations.";
    } else if (industry_ == Industry::kHealthcare && classification == "phi") {
      statement += " This may result in HIPAA regulatory violations.";
    }
  }

  return statement;
}

void StatementGenerator::Apply(model::Threat& threat) const {
  auto statement              = Render(threat);
  threat.risk->risk_statement = std::move(statement);
}

} // namespace refiner::refine
