#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/refinement_service.hpp"
#include "refiner/v1/refinement_service.grpc.pb.h"

namespace refiner::grpc {

class RefinementServer final : public refiner::v1::RefinementService::Service {
 public:
  explicit RefinementServer(std::shared_ptr<refiner::service::RefinementService> svc);

  ::grpc::Status RefineThreats(::grpc::ServerContext*, const refiner::v1::RefineThreatsRequest*, refiner::v1::RefineThreatsResponse*) override;

 private:
  std::shared_ptr<refiner::service::RefinementService> service_;
};

} // namespace refiner::grpc
