#pragma once

#include <memory>

namespace refiner::core {
class RefinementOrchestrator;
}
namespace refiner::vuln {
class VulnerabilityCatalog;
}
namespace refiner::db {
class VulnerabilityRepository;
}

namespace refiner::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<refiner::core::RefinementOrchestrator> orchestrator;
  std::shared_ptr<refiner::vuln::VulnerabilityCatalog>   catalog;
  std::shared_ptr<refiner::db::VulnerabilityRepository>  vulnerability_cache;
};

} // namespace refiner::service
