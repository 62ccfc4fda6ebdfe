#include "semantic_deduplicator.hpp"

#include <algorithm>
#include <deque>
#include <string>

#include "internal/refine/transitions.hpp"

namespace refiner::refine {

namespace {

template <typename T>
void AppendUnique(std::vector<T>& into, const T& value) {
  if (std::find(into.begin(), into.end(), value) == into.end()) into.push_back(value);
}

bool BetterRepresentative(const model::Threat& a, const model::Threat& b) {
  if (a.inherent_risk_score != b.inherent_risk_score) return a.inherent_risk_score > b.inherent_risk_score;
  if (a.id.size() != b.id.size()) return a.id.size() < b.id.size();
  return a.id < b.id;
}

void Absorb(model::Threat& representative, const model::Threat& member) {
  for (const auto& cve : member.cited_cves) {
    AppendUnique(representative.cited_cves, cve);
  }

  for (const auto& assessment : member.cve_assessments) {
    auto it = std::find_if(representative.cve_assessments.begin(), representative.cve_assessments.end(),
                           [&](const model::CveAssessment& existing) { return existing.cve_id == assessment.cve_id; });
    if (it == representative.cve_assessments.end()) representative.cve_assessments.push_back(assessment);
  }

  auto absorb_mitigation = [&representative](const std::string& mitigation) {
    if (mitigation.empty() || mitigation == representative.mitigation_suggestion) return;
    AppendUnique(representative.additional_mitigations, mitigation);
  };
  absorb_mitigation(member.mitigation_suggestion);
  for (const auto& mitigation : member.additional_mitigations) {
    absorb_mitigation(mitigation);
  }

  for (const auto& reference : member.other_references) {
    AppendUnique(representative.other_references, reference);
  }

  AppendUnique(representative.merged_from, member.id);
}

} // namespace

std::string EmbeddingText(const model::Threat& threat) {
  return threat.ComponentName() + " " + std::string(model::ToString(threat.stride_category)) + " " + threat.description;
}

SemanticDeduplicator::SemanticDeduplicator(const Embedder& embedder, DedupOptions options) : embedder_(embedder), options_(options) {
}

std::vector<model::Cluster> SemanticDeduplicator::Run(std::vector<model::Threat>& threats) const {
  std::vector<std::size_t> active;
  for (std::size_t i = 0; i < threats.size(); ++i) {
    if (!threats[i].IsActive()) continue;
    if (threats[i].cluster_id) {
      throw util::InvariantViolation("deduplicate: threat " + threats[i].id + " already has cluster " + *threats[i].cluster_id +
                                     "; deduplication runs once per batch");
    }
    active.push_back(i);
  }

  std::vector<Embedding> embeddings;
  embeddings.reserve(active.size());
  for (auto index : active) {
    embeddings.push_back(embedder_.Embed(EmbeddingText(threats[index])));
  }

  auto neighbors = [&](std::size_t a, std::size_t b) {
    const auto& left  = threats[active[a]];
    const auto& right = threats[active[b]];
    if (left.stride_category != right.stride_category) return false;
    if (options_.require_same_component && left.ComponentName() != right.ComponentName()) return false;
    return CosineSimilarity(embeddings[a], embeddings[b]) >= options_.similarity_threshold;
  };

  std::vector<model::Cluster> clusters;
  std::vector<bool>           assigned(active.size(), false);

  for (std::size_t seed = 0; seed < active.size(); ++seed) {
    if (assigned[seed]) continue;

    model::Cluster cluster;
    cluster.id = "cluster-" + std::to_string(clusters.size() + 1);

    std::vector<std::size_t> members;
    std::deque<std::size_t>  frontier{seed};
    assigned[seed] = true;

    while (!frontier.empty()) {
      const auto current = frontier.front();
      frontier.pop_front();
      members.push_back(current);

      for (std::size_t candidate = 0; candidate < active.size(); ++candidate) {
        if (assigned[candidate] || !neighbors(current, candidate)) continue;
        assigned[candidate] = true;
        frontier.push_back(candidate);
      }
    }

    // members in input order
    std::sort(members.begin(), members.end());

    std::size_t representative = members.front();
    for (auto member : members) {
      if (BetterRepresentative(threats[active[member]], threats[active[representative]])) representative = member;
    }

    auto& rep                 = threats[active[representative]];
    cluster.representative_id = rep.id;

    for (auto member : members) {
      auto& threat      = threats[active[member]];
      threat.cluster_id = cluster.id;
      cluster.member_threat_ids.push_back(threat.id);
      if (member == representative) continue;

      Absorb(rep, threat);
      MarkMerged(threat, rep.id);
    }

    clusters.push_back(std::move(cluster));
  }

  return clusters;
}

} // namespace refiner::refine
