#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace release::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace release::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const DeploymentError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  // RegistryError and anything unexpected.
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace release::grpc
