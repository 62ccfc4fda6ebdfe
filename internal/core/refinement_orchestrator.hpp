#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/refinement_config.hpp"
#include "internal/core/run_context.hpp"
#include "internal/core/worker_pool.hpp"
#include "internal/ingest/record_validator.hpp"
#include "internal/model/cluster.hpp"
#include "internal/model/threat.hpp"
#include "internal/refine/embedder.hpp"
#include "internal/vuln/vulnerability_catalog.hpp"

namespace refiner::v1 {
class RefineThreatsRequest;
}

namespace refiner::core {

struct RefinementStatistics {
  std::size_t original_count            = 0;
  std::size_t rejected_count            = 0;
  std::size_t suppressed_by_control     = 0;
  std::size_t suppressed_stale_cve      = 0;
  std::size_t suppressed_low_quality    = 0;
  std::size_t merged_count              = 0;
  std::size_t cluster_count             = 0;
  std::size_t final_count               = 0;
  std::size_t unmatched_component_count = 0;

  std::size_t critical_count = 0;
  std::size_t high_count     = 0;
  std::size_t medium_count   = 0;
  std::size_t low_count      = 0;
};

struct RefinementReport {
  // active first by residual_risk descending, then the rest; ties by id
  std::vector<model::Threat>          threats;
  std::vector<model::Cluster>         clusters;
  std::vector<ingest::RejectedRecord> rejected;
  std::vector<std::string>            warnings;
  RefinementStatistics                statistics;
};

struct StageProgress {
  std::string stage;
  std::size_t stage_index  = 0; // 1-based
  std::size_t stage_count  = 0;
  std::size_t active_count = 0; // active threats after the stage
  std::size_t changed      = 0; // threats the stage suppressed, merged or scored
};

using ProgressObserver = std::function<void(const StageProgress&)>;

/*
  Runs the refinement pipeline over one batch.

    ingest -> standardize -> suppress -> resolve CVEs -> cve filter
           -> quality gate -> deduplicate -> risk -> statements

  Per-threat stages fan out on the worker pool; deduplication is a
  single-threaded barrier. Stages without their side input are no-ops
  but still run in order. Identical requests produce identical reports.

  Malformed records are quarantined in the report. Feed failures become
  warnings. InvariantViolation escapes and the run yields no report.
*/
class RefinementOrchestrator {
 public:
  RefinementOrchestrator(config::RefinementConfig                    config,
                         std::shared_ptr<vuln::VulnerabilityCatalog> catalog,
                         std::vector<model::Control>                 default_controls = {},
                         std::shared_ptr<const refine::Embedder>     embedder         = nullptr);

  RefinementReport Run(const refiner::v1::RefineThreatsRequest& request, const ProgressObserver& observer = {});

  const config::RefinementConfig& Config() const {
    return config_;
  }

 private:
  RunContext BuildContext(const refiner::v1::RefineThreatsRequest& request, ingest::IngestedBatch& batch) const;

  // Applies fn to every active threat on the pool; returns how many calls returned true.
  std::size_t ForEachActive(std::vector<model::Threat>& threats, const std::function<bool(model::Threat&)>& fn);

  const config::RefinementConfig              config_;
  std::shared_ptr<vuln::VulnerabilityCatalog> catalog_;
  const std::vector<model::Control>           default_controls_;
  std::shared_ptr<const refine::Embedder>     embedder_;
  ingest::RecordValidator                     validator_;
  WorkerPool                                  pool_;
};

// Final ordering of the report.
void SortForReport(std::vector<model::Threat>& threats);

RefinementStatistics ComputeStatistics(const std::vector<model::Threat>& threats, std::size_t rejected, std::size_t clusters);

// Throws util::InvariantViolation when the refined batch is inconsistent.
void VerifyInvariants(const std::vector<model::Threat>& threats);

} // namespace refiner::core
