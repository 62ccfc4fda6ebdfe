#include "refinement_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <set>

#include "internal/model/enum_parsing.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/refine/component_standardizer.hpp"
#include "internal/refine/control_suppressor.hpp"
#include "internal/refine/cve_relevance_filter.hpp"
#include "internal/refine/hashing_embedder.hpp"
#include "internal/refine/quality_gate.hpp"
#include "internal/refine/risk_calculator.hpp"
#include "internal/refine/semantic_deduplicator.hpp"
#include "internal/refine/statement_generator.hpp"
#include "internal/util/errors.hpp"
#include "refiner/v1.hpp"

namespace refiner::core {

namespace {

using refiner::observability::IntField;
using refiner::observability::StringField;

constexpr std::size_t kStageCount = 8;

std::size_t CountActive(const std::vector<model::Threat>& threats) {
  return static_cast<std::size_t>(std::count_if(threats.begin(), threats.end(), [](const model::Threat& t) { return t.IsActive(); }));
}

/*
  Times a stage, reports it to metrics and tracing, and notifies the
  progress observer once the stage finishes.
*/
class StageTimer {
 public:
  StageTimer(std::string_view name, std::size_t index, const ProgressObserver& observer)
      : name_(name), index_(index), observer_(observer), span_("refine.stage." + std::string(name)), started_at_(std::chrono::steady_clock::now()) {
  }

  void Finish(const std::vector<model::Threat>& threats, std::size_t changed) {
    const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at_).count();
    const auto active     = CountActive(threats);

    span_.SetCount("threats.changed", changed);
    span_.SetCount("threats.active", active);
    observability::Metrics::Instance().RecordStage(name_, elapsed_ms, changed);

    REFINER_LOG_DEBUG("stage finished", {StringField("stage", name_), IntField("changed", static_cast<std::int64_t>(changed)),
                                         IntField("active", static_cast<std::int64_t>(active))});

    if (observer_) {
      observer_(StageProgress{name_, index_, kStageCount, active, changed});
    }
  }

 private:
  std::string                           name_;
  std::size_t                           index_;
  const ProgressObserver&               observer_;
  observability::SpanScope              span_;
  std::chrono::steady_clock::time_point started_at_;
};

bool ReportOrder(const model::Threat& a, const model::Threat& b) {
  const bool a_scored = a.IsActive() && a.risk.has_value();
  const bool b_scored = b.IsActive() && b.risk.has_value();
  if (a_scored != b_scored) return a_scored;
  if (a_scored && a.risk->residual_risk != b.risk->residual_risk) return a.risk->residual_risk > b.risk->residual_risk;
  return a.id < b.id;
}

} // namespace

RefinementOrchestrator::RefinementOrchestrator(config::RefinementConfig                    config,
                                               std::shared_ptr<vuln::VulnerabilityCatalog> catalog,
                                               std::vector<model::Control>                 default_controls,
                                               std::shared_ptr<const refine::Embedder>     embedder)
    : config_(std::move(config)),
      catalog_(std::move(catalog)),
      default_controls_(std::move(default_controls)),
      embedder_(embedder ? std::move(embedder) : std::make_shared<refine::HashingEmbedder>(config_.embedding_dimensions)),
      pool_(config_.worker_threads) {
  refiner::config::Validate(config_);
}

std::size_t RefinementOrchestrator::ForEachActive(std::vector<model::Threat>& threats, const std::function<bool(model::Threat&)>& fn) {
  std::vector<std::size_t> active;
  for (std::size_t i = 0; i < threats.size(); ++i) {
    if (threats[i].IsActive()) active.push_back(i);
  }

  // one slot per threat: workers never share a write target
  std::vector<char> changed(active.size(), 0);
  pool_.ParallelFor(active.size(), [&](std::size_t i) { changed[i] = fn(threats[active[i]]) ? 1 : 0; });

  return static_cast<std::size_t>(std::count(changed.begin(), changed.end(), 1));
}

RunContext RefinementOrchestrator::BuildContext(const refiner::v1::RefineThreatsRequest& request, ingest::IngestedBatch& batch) const {
  RunContext ctx;

  const auto as_of = request.has_as_of() ? util::FromProto(request.as_of()) : util::Now();
  ctx.as_of        = std::chrono::floor<std::chrono::days>(as_of);

  ctx.industry = config_.default_industry;
  if (!request.industry().empty()) {
    if (auto industry = model::ParseIndustry(request.industry())) {
      ctx.industry = *industry;
    } else {
      ctx.warnings.push_back("unknown industry '" + request.industry() + "'; using " + std::string(model::ToString(ctx.industry)) + " templates");
    }
  }

  ctx.components = std::move(batch.components);
  ctx.controls   = request.controls_size() > 0 ? std::move(batch.controls) : default_controls_;

  if (ctx.components.empty()) {
    ctx.warnings.push_back("component inventory is empty; every threat is unmatched");
  }
  return ctx;
}

RefinementReport RefinementOrchestrator::Run(const refiner::v1::RefineThreatsRequest& request, const ProgressObserver& observer) {
  observability::SpanScope span("refine.run");

  auto batch = validator_.Ingest(request);
  auto ctx   = BuildContext(request, batch);

  auto&       threats          = batch.threats;
  std::size_t rejected_threats = static_cast<std::size_t>(
      std::count_if(batch.rejected.begin(), batch.rejected.end(), [](const ingest::RejectedRecord& r) { return r.kind == "threat"; }));

  span.SetCount("threats.accepted", threats.size());
  span.SetCount("threats.rejected", rejected_threats);
  span.SetCount("components", ctx.components.size());
  span.SetLabel("industry", model::ToString(ctx.industry));

  std::size_t stage = 0;

  {
    StageTimer                           timer("standardize", ++stage, observer);
    const refine::ComponentStandardizer standardizer(ctx.components, config_.acceptance_threshold);
    auto unmatched = ForEachActive(threats, [&](model::Threat& threat) {
      standardizer.Apply(threat);
      return threat.unmatched_component;
    });
    timer.Finish(threats, unmatched);
  }

  {
    StageTimer                       timer("suppress", ++stage, observer);
    const refine::ControlSuppressor suppressor(ctx.controls, config_.suppress_matching_controls);
    std::size_t                      suppressed = 0;
    if (!ctx.controls.empty()) {
      suppressed = ForEachActive(threats, [&](model::Threat& threat) { return suppressor.Apply(threat); });
    }
    timer.Finish(threats, suppressed);
  }

  {
    StageTimer timer("resolve_cves", ++stage, observer);

    std::vector<std::string> cited;
    for (const auto& threat : threats) {
      if (!threat.IsActive()) continue;
      cited.insert(cited.end(), threat.cited_cves.begin(), threat.cited_cves.end());
    }

    std::size_t resolved = 0;
    if (!cited.empty()) {
      if (catalog_) {
        auto resolution     = catalog_->Resolve(cited);
        resolved            = resolution.snapshot.Size();
        ctx.vulnerabilities = std::move(resolution.snapshot);
        for (auto& warning : resolution.warnings) {
          ctx.warnings.push_back(std::move(warning));
        }
      } else {
        ctx.warnings.push_back("no vulnerability catalog configured; cited CVEs have unknown relevance");
      }
    }
    timer.Finish(threats, resolved);
  }

  {
    StageTimer                        timer("cve_filter", ++stage, observer);
    const refine::CveRelevanceFilter filter(ctx.vulnerabilities, ctx.as_of, config_.cve_staleness_years);
    auto suppressed = ForEachActive(threats, [&](model::Threat& threat) { return filter.Apply(threat); });
    timer.Finish(threats, suppressed);
  }

  {
    StageTimer                 timer("quality_gate", ++stage, observer);
    const refine::QualityGate gate(config_.quality);
    std::size_t                suppressed = 0;
    if (config_.quality.enabled) {
      suppressed = ForEachActive(threats, [&](model::Threat& threat) { return gate.Apply(threat); });
    }
    timer.Finish(threats, suppressed);
  }

  std::vector<model::Cluster> clusters;
  {
    StageTimer                          timer("deduplicate", ++stage, observer);
    const refine::SemanticDeduplicator dedup(*embedder_, refine::DedupOptions{config_.similarity_threshold, config_.require_same_component});
    const auto                          active_before = CountActive(threats);
    clusters                                          = dedup.Run(threats);
    timer.Finish(threats, active_before - CountActive(threats));
  }

  {
    StageTimer                    timer("risk", ++stage, observer);
    const refine::RiskCalculator calculator(ctx.components, ctx.controls, config_.risk);
    auto scored = ForEachActive(threats, [&](model::Threat& threat) {
      calculator.Apply(threat);
      return true;
    });
    timer.Finish(threats, scored);
  }

  {
    StageTimer                        timer("statements", ++stage, observer);
    const refine::StatementGenerator generator(ctx.industry, config_.templates, ctx.components);
    auto rendered = ForEachActive(threats, [&](model::Threat& threat) {
      generator.Apply(threat);
      return true;
    });
    timer.Finish(threats, rendered);
  }

  VerifyInvariants(threats);
  SortForReport(threats);

  RefinementReport report;
  report.statistics = ComputeStatistics(threats, rejected_threats, clusters.size());
  report.threats    = std::move(threats);
  report.clusters   = std::move(clusters);
  report.rejected   = std::move(batch.rejected);
  report.warnings   = std::move(ctx.warnings);

  const auto& stats = report.statistics;
  span.SetCount("threats.final", stats.final_count);
  span.SetCount("clusters", stats.cluster_count);
  span.SetCount("warnings", report.warnings.size());

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordThreatOutcome("active", stats.final_count);
  metrics.RecordThreatOutcome("suppressed", stats.suppressed_by_control + stats.suppressed_stale_cve + stats.suppressed_low_quality);
  metrics.RecordThreatOutcome("merged", stats.merged_count);
  metrics.RecordThreatOutcome("rejected", stats.rejected_count);

  REFINER_LOG_INFO("refinement finished", {IntField("original", static_cast<std::int64_t>(stats.original_count)),
                                           IntField("rejected", static_cast<std::int64_t>(stats.rejected_count)),
                                           IntField("suppressed_control", static_cast<std::int64_t>(stats.suppressed_by_control)),
                                           IntField("suppressed_stale_cve", static_cast<std::int64_t>(stats.suppressed_stale_cve)),
                                           IntField("suppressed_low_quality", static_cast<std::int64_t>(stats.suppressed_low_quality)),
                                           IntField("merged", static_cast<std::int64_t>(stats.merged_count)),
                                           IntField("final", static_cast<std::int64_t>(stats.final_count)),
                                           IntField("warnings", static_cast<std::int64_t>(report.warnings.size()))});

  return report;
}

void SortForReport(std::vector<model::Threat>& threats) {
  std::sort(threats.begin(), threats.end(), ReportOrder);
}

RefinementStatistics ComputeStatistics(const std::vector<model::Threat>& threats, std::size_t rejected, std::size_t clusters) {
  RefinementStatistics stats;
  stats.original_count = threats.size() + rejected;
  stats.rejected_count = rejected;
  stats.cluster_count  = clusters;

  for (const auto& threat : threats) {
    if (threat.unmatched_component) ++stats.unmatched_component_count;

    switch (threat.status) {
      case model::ThreatStatus::kSuppressed: {
        const auto& reason = threat.suppressed_reason.value_or("");
        if (reason.rfind("control:", 0) == 0) {
          ++stats.suppressed_by_control;
        } else if (reason == "stale_cve") {
          ++stats.suppressed_stale_cve;
        } else if (reason == "low_quality") {
          ++stats.suppressed_low_quality;
        }
        break;
      }
      case model::ThreatStatus::kMerged:
        ++stats.merged_count;
        break;
      case model::ThreatStatus::kActive: {
        ++stats.final_count;
        const auto band = threat.risk ? threat.risk->severity_band : std::string{};
        if (band == "Critical") {
          ++stats.critical_count;
        } else if (band == "High") {
          ++stats.high_count;
        } else if (band == "Medium") {
          ++stats.medium_count;
        } else if (band == "Low") {
          ++stats.low_count;
        }
        break;
      }
    }
  }

  return stats;
}

void VerifyInvariants(const std::vector<model::Threat>& threats) {
  std::set<std::string> ids;
  for (const auto& threat : threats) {
    if (!ids.insert(threat.id).second) {
      throw util::InvariantViolation("verify: duplicate threat id " + threat.id);
    }

    const bool suppressed = threat.status == model::ThreatStatus::kSuppressed;
    if (suppressed != threat.suppressed_reason.has_value()) {
      throw util::InvariantViolation("verify: threat " + threat.id + " suppressed_reason does not match its status");
    }
    if (!threat.IsActive() && threat.risk) {
      throw util::InvariantViolation("verify: " + std::string(model::ToString(threat.status)) + " threat " + threat.id + " carries risk fields");
    }
    if (threat.IsActive() && (!threat.cluster_id || !threat.risk)) {
      throw util::InvariantViolation("verify: active threat " + threat.id + " was not clustered and scored");
    }
    if (threat.status == model::ThreatStatus::kMerged && (!threat.merged_into || !threat.cluster_id)) {
      throw util::InvariantViolation("verify: merged threat " + threat.id + " has no representative");
    }
  }
}

} // namespace refiner::core
