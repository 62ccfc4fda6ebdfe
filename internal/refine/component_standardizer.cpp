#include "component_standardizer.hpp"

#include <algorithm>

#include "internal/util/text.hpp"

namespace refiner::refine {

namespace {

constexpr std::string_view kFlowPrefix = "data flow from ";
constexpr std::string_view kFlowSuffix = " data flow";

} // namespace

std::string NormalizeComponentName(std::string_view name) {
  std::string text(name);
  text = util::ReplaceAll(std::move(text), "->", " to ");
  text = util::ReplaceAll(std::move(text), "→", " to ");

  auto normalized = util::NormalizeText(text);

  if (normalized.rfind(kFlowPrefix, 0) == 0) {
    normalized.erase(0, kFlowPrefix.size());
  }
  if (normalized.size() > kFlowSuffix.size() && normalized.compare(normalized.size() - kFlowSuffix.size(), kFlowSuffix.size(), kFlowSuffix) == 0) {
    normalized.erase(normalized.size() - kFlowSuffix.size());
  }
  return normalized;
}

double ComponentSimilarity(std::string_view a, std::string_view b) {
  const auto left  = NormalizeComponentName(a);
  const auto right = NormalizeComponentName(b);
  if (left.empty() || right.empty()) return left == right ? 1.0 : 0.0;
  return std::max(util::TokenSetSimilarity(left, right), util::EditSimilarity(left, right));
}

ComponentStandardizer::ComponentStandardizer(const std::vector<model::Component>& inventory, double acceptance_threshold)
    : acceptance_threshold_(acceptance_threshold) {
  entries_.reserve(inventory.size());
  for (const auto& component : inventory) {
    entries_.push_back(Entry{component.canonical_name, NormalizeComponentName(component.canonical_name)});
  }
}

ComponentMatch ComponentStandardizer::Match(std::string_view component_ref) const {
  const auto normalized = NormalizeComponentName(component_ref);

  ComponentMatch best;
  if (normalized.empty()) return best;

  std::optional<std::size_t> best_index;
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const auto& candidate = entries_[i].normalized;
    if (candidate.empty()) continue;

    const double score = std::max(util::TokenSetSimilarity(normalized, candidate), util::EditSimilarity(normalized, candidate));
    // strict comparison keeps the earliest entry on ties
    if (!best_index || score > best.score) {
      best_index = i;
      best.score = score;
    }
  }

  if (best_index && best.score >= acceptance_threshold_) {
    best.index = best_index;
  }
  return best;
}

void ComponentStandardizer::Apply(model::Threat& threat) const {
  auto match         = Match(threat.component_ref);
  threat.match_score = match.score;

  if (match.index) {
    threat.canonical_component = entries_[*match.index].canonical_name;
    threat.unmatched_component = false;
  } else {
    threat.canonical_component.reset();
    threat.unmatched_component = true;
  }
}

} // namespace refiner::refine
