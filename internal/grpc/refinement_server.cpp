#include "refinement_server.hpp"

#include "grpc_error.hpp"
#include "refiner/v1.hpp"

namespace refiner::grpc {

RefinementServer::RefinementServer(std::shared_ptr<refiner::service::RefinementService> svc) : service_(std::move(svc)) {
}

::grpc::Status RefinementServer::RefineThreats(::grpc::ServerContext*,
                                               const refiner::v1::RefineThreatsRequest* req,
                                               refiner::v1::RefineThreatsResponse*      resp) {
  try {
    *resp = service_->RefineThreats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace refiner::grpc
