#pragma once

#include <string_view>
#include <vector>

namespace refiner::refine {

using Embedding = std::vector<float>;

/*
  Text embedding seam. Implementations must be deterministic: the same
  text always yields the same vector.
*/
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual Embedding Embed(std::string_view text) const = 0;
};

// Cosine similarity; 0 when either vector is all zeros.
double CosineSimilarity(const Embedding& a, const Embedding& b);

} // namespace refiner::refine
