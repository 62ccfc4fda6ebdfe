#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/control.hpp"
#include "internal/service/refinement_service.hpp"
#include "internal/service/service_context.hpp"

namespace refiner::core {
class RefinementOrchestrator;
}
namespace refiner::db {
class VulnerabilityRepository;
}
namespace refiner::vuln {
class VulnerabilityCatalog;
class VulnerabilityFeed;
} // namespace refiner::vuln

namespace refiner::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext                       context;
  std::shared_ptr<service::RefinementService>   refinement_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  This is the composition root of the application.
  It is the ONLY place allowed to know concrete feed and cache types.
*/
Application Build(const refiner::runtime::config::RuntimeConfig& config);

// Pieces of Build, usable on their own by refinectl and tests.
std::shared_ptr<db::VulnerabilityRepository>  BuildVulnerabilityCache(const refiner::runtime::config::RuntimeConfig& config);
std::shared_ptr<vuln::VulnerabilityFeed>      BuildVulnerabilityFeed(const refiner::runtime::config::RuntimeConfig& config);
std::shared_ptr<vuln::VulnerabilityCatalog>   BuildVulnerabilityCatalog(const refiner::runtime::config::RuntimeConfig& config,
                                                                        std::shared_ptr<db::VulnerabilityRepository> cache);
std::vector<model::Control>                   BuildControlRegistry(const refiner::runtime::config::RuntimeConfig& config);
std::shared_ptr<core::RefinementOrchestrator> BuildOrchestrator(const refiner::runtime::config::RuntimeConfig& config,
                                                                std::shared_ptr<vuln::VulnerabilityCatalog>    catalog);

} // namespace refiner::factory
