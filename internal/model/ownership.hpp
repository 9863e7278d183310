#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pagereg::model {

using Principal = std::string;
using Amount    = std::uint64_t;
using PageId    = std::uint64_t;
using RequestId = std::uint64_t;

// Wire values match pagereg.v1.OwnershipKind.
enum class OwnershipKind : std::uint8_t {
  kUnspecified    = 0,
  kSingle         = 1,
  kMultiSig       = 2,
  kPermissionless = 3,
};

struct OwnershipConfig {
  OwnershipKind          kind = OwnershipKind::kUnspecified;
  std::vector<Principal> owners;
  std::uint32_t          threshold = 0;
};

constexpr const char* OwnershipKindName(OwnershipKind kind) {
  switch (kind) {
    case OwnershipKind::kSingle:
      return "single";
    case OwnershipKind::kMultiSig:
      return "multisig";
    case OwnershipKind::kPermissionless:
      return "permissionless";
    default:
      return "unspecified";
  }
}

}  // namespace pagereg::model
