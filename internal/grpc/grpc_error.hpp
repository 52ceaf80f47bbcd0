#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace medianode::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace medianode::grpc
