#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/component.hpp"
#include "internal/model/threat.hpp"

namespace refiner::refine {

struct ComponentMatch {
  std::optional<std::size_t> index; // into the inventory; empty below threshold
  double                     score = 0.0;
};

/*
  Maps the component name a threat cites onto the inventory.

  Similarity is max(token-set Jaccard, normalized edit similarity) over
  normalized names. The best score wins; ties go to the entry listed
  first in the inventory. Below the acceptance threshold the threat keeps
  its component_ref and is flagged unmatched.
*/
class ComponentStandardizer {
 public:
  ComponentStandardizer(const std::vector<model::Component>& inventory, double acceptance_threshold);

  ComponentMatch Match(std::string_view component_ref) const;

  void Apply(model::Threat& threat) const;

 private:
  struct Entry {
    std::string canonical_name;
    std::string normalized;
  };

  std::vector<Entry> entries_;
  double             acceptance_threshold_;
};

// Lowercased, punctuation-free name with arrows spelled "to" and the
// "data flow from ..." / "... data flow" wrapping removed.
std::string NormalizeComponentName(std::string_view name);

// Symmetric, in [0, 1].
double ComponentSimilarity(std::string_view a, std::string_view b);

} // namespace refiner::refine
