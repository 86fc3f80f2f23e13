#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace mlmeta::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Status code for a backend-reported HTTP-style status.
::grpc::StatusCode BackendStatusCode(int backend_status);

} // namespace mlmeta::grpc
