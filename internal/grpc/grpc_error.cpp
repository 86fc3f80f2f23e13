#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace mlmeta::grpc {

::grpc::StatusCode BackendStatusCode(int backend_status) {
  switch (backend_status) {
    case 400:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case 404:
      return ::grpc::StatusCode::NOT_FOUND;
    case 409:
      return ::grpc::StatusCode::ABORTED;
    case 503:
      return ::grpc::StatusCode::UNAVAILABLE;
    default:
      return ::grpc::StatusCode::INTERNAL;
  }
}

::grpc::Status ToStatus(const std::exception& e) {
  using namespace mlmeta::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const FormatError*>(&e) || dynamic_cast<const ParseError*>(&e) || dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (const auto* backend = dynamic_cast<const BackendError*>(&e)) {
    return {BackendStatusCode(backend->StatusCode()), "backend status " + std::to_string(backend->StatusCode()) + ": " + e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace mlmeta::grpc
