#include "grpc_error.hpp"

namespace refiner::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace refiner::util;

  if (dynamic_cast<const InvalidInput*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidConfig*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const FeedUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }

  // InvariantViolation and anything unexpected
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace refiner::grpc
