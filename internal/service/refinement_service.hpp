#pragma once

#include "refiner/v1/refinement_service.pb.h"
#include "service_context.hpp"

namespace refiner::service {

class RefinementService {
 public:
  explicit RefinementService(ServiceContext ctx);

  refiner::v1::RefineThreatsResponse RefineThreats(const refiner::v1::RefineThreatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace refiner::service
