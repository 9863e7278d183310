#include "errors.hpp"

namespace pagereg::util {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInternal:
      return "Internal";
    case ErrorCode::kInvalidConfig:
      return "InvalidConfig";
    case ErrorCode::kInvalidVariant:
      return "InvalidVariant";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kInvalidContentFormat:
      return "InvalidContentFormat";
    case ErrorCode::kEmptyUpdate:
      return "EmptyUpdate";
    case ErrorCode::kInsufficientFee:
      return "InsufficientFee";
    case ErrorCode::kBalanceOverflow:
      return "BalanceOverflow";
    case ErrorCode::kPageNotFound:
      return "PageNotFound";
    case ErrorCode::kInvalidRequest:
      return "InvalidRequest";
    case ErrorCode::kUnauthorized:
      return "Unauthorized";
    case ErrorCode::kPageFrozen:
      return "PageFrozen";
    case ErrorCode::kAlreadyExecuted:
      return "AlreadyExecuted";
    case ErrorCode::kDuplicateVote:
      return "DuplicateVote";
    case ErrorCode::kApprovalNotApplicable:
      return "ApprovalNotApplicable";
    case ErrorCode::kTransitionNotAllowed:
      return "TransitionNotAllowed";
    case ErrorCode::kNothingToWithdraw:
      return "NothingToWithdraw";
    case ErrorCode::kNotWithdrawable:
      return "NotWithdrawable";
    case ErrorCode::kNotPermissionless:
      return "NotPermissionless";
    case ErrorCode::kNothingToDistribute:
      return "NothingToDistribute";
    case ErrorCode::kNoParticipants:
      return "NoParticipants";
    case ErrorCode::kReentrantCall:
      return "ReentrantCall";
    case ErrorCode::kTransferFailed:
      return "TransferFailed";
  }
  return "Unknown";
}

} // namespace pagereg::util
