#pragma once

// Single include point for pagereg.v1 API messages. The gRPC stubs
// (page_registry_service.grpc.pb.h) are included by the gRPC layer only.

#include "pagereg/v1/types.pb.h"
#include "pagereg/v1/page_registry_service.pb.h"
