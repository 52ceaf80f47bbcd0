#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace medianode::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace medianode::util;

  if (dynamic_cast<const NodeNotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidStateTransition*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const UsageUnderflow*>(&e)) {
    return {::grpc::StatusCode::OUT_OF_RANGE, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const ProvisioningFailure*>(&e) || dynamic_cast<const Unavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace medianode::grpc
