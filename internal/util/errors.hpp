#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pagereg::util {

/*
  Central error types.

  Every failure of a registry operation is one of these. The error code names
  the exact condition; the class names its category. The gRPC layer maps
  categories to status codes.
*/

enum class ErrorCode : std::uint8_t {
  kInternal = 0,

  // validation
  kInvalidConfig,
  kInvalidVariant,
  kInvalidArgument,
  kInvalidContentFormat,
  kEmptyUpdate,
  kInsufficientFee,
  kBalanceOverflow,

  // lookup
  kPageNotFound,
  kInvalidRequest,

  // authorization
  kUnauthorized,

  // state conflict
  kPageFrozen,
  kAlreadyExecuted,
  kDuplicateVote,
  kApprovalNotApplicable,
  kTransitionNotAllowed,
  kNothingToWithdraw,
  kNotWithdrawable,
  kNotPermissionless,
  kNothingToDistribute,
  kNoParticipants,
  kReentrantCall,

  // external payout
  kTransferFailed,
};

std::string_view ErrorCodeName(ErrorCode code);

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const noexcept {
    return code_;
  }

 private:
  ErrorCode code_;
};

class InvalidArgument : public Error {
 public:
  InvalidArgument(ErrorCode code, const std::string& msg) : Error(code, msg) {
  }
};

class NotFound : public Error {
 public:
  NotFound(ErrorCode code, const std::string& msg) : Error(code, msg) {
  }
};

class PermissionDenied : public Error {
 public:
  explicit PermissionDenied(const std::string& msg) : Error(ErrorCode::kUnauthorized, msg) {
  }
};

class InvalidState : public Error {
 public:
  InvalidState(ErrorCode code, const std::string& msg) : Error(code, msg) {
  }
};

class TransferFailed : public Error {
 public:
  explicit TransferFailed(const std::string& msg) : Error(ErrorCode::kTransferFailed, msg) {
  }
};

// Repository failures that are not part of the domain taxonomy.
class StorageError : public Error {
 public:
  explicit StorageError(const std::string& msg) : Error(ErrorCode::kInternal, msg) {
  }
};

} // namespace pagereg::util
