#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace pagereg::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The status message carries the error code name as a prefix, e.g.
  "PageFrozen: page 3 is immutable".
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace pagereg::grpc
