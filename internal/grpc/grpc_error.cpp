#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace pagereg::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace pagereg::util;

  const auto* error = dynamic_cast<const Error*>(&e);
  if (!error) {
    return {::grpc::StatusCode::INTERNAL, e.what()};
  }

  const auto message = std::string(ErrorCodeName(error->code())) + ": " + e.what();

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, message};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, message};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, message};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, message};
  }
  if (dynamic_cast<const TransferFailed*>(&e)) {
    return {::grpc::StatusCode::ABORTED, message};
  }

  return {::grpc::StatusCode::INTERNAL, message};
}

} // namespace pagereg::grpc
