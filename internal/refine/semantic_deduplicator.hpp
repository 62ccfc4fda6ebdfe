#pragma once

#include <vector>

#include "internal/model/cluster.hpp"
#include "internal/model/threat.hpp"
#include "internal/refine/embedder.hpp"

namespace refiner::refine {

struct DedupOptions {
  double similarity_threshold   = 0.85;
  bool   require_same_component = true;
};

/*
  Groups near-duplicate active threats and collapses each group onto one
  representative.

  Clustering is DBSCAN with min_points = 1 and cosine similarity >=
  threshold as the neighborhood, so clusters are the connected
  components of the similarity graph. Threats of different STRIDE
  categories are never neighbors. Threats are visited in input order and
  clusters are numbered "cluster-1", "cluster-2", ... by first member.

  The representative has the highest inherent_risk_score, then the
  shortest id, then the smallest id. It absorbs the members' CVEs,
  mitigations and references; the others become merged.

  Single-threaded; runs once per batch.
*/
class SemanticDeduplicator {
 public:
  SemanticDeduplicator(const Embedder& embedder, DedupOptions options);

  std::vector<model::Cluster> Run(std::vector<model::Threat>& threats) const;

 private:
  const Embedder& embedder_;
  DedupOptions    options_;
};

// Text the embedder sees for a threat: component, category, description.
std::string EmbeddingText(const model::Threat& threat);

} // namespace refiner::refine
