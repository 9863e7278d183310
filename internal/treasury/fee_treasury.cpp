#include "fee_treasury.hpp"

#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace pagereg::treasury {

using util::ErrorCode;

model::Amount Credit(model::Amount balance, model::Amount paid) {
  if (balance > std::numeric_limits<model::Amount>::max() - paid) {
    throw util::InvalidArgument(ErrorCode::kBalanceOverflow, "treasury balance would overflow");
  }
  return balance + paid;
}

model::PayoutSplit PlanWithdrawal(const policy::OwnershipPolicy& policy, model::Amount balance, const model::Principal& caller) {
  // Throws NotWithdrawable for policies without owners, whatever the balance.
  auto split = policy.PayoutShares(balance);

  if (balance == 0) {
    throw util::InvalidState(ErrorCode::kNothingToWithdraw, "page treasury is empty");
  }
  if (!policy.IsAuthorized(caller)) {
    throw util::PermissionDenied("caller " + caller + " is not an owner of the page");
  }
  return split;
}

model::Payout PlanDistribution(const policy::OwnershipPolicy& policy, model::Amount balance,
                               const participants::ParticipantLedger& participants, const BlockContext& context,
                               const model::Principal& caller) {
  if (policy.Kind() != model::OwnershipKind::kPermissionless) {
    throw util::InvalidState(ErrorCode::kNotPermissionless, "only permissionless page treasuries are distributed");
  }
  if (balance == 0) {
    throw util::InvalidState(ErrorCode::kNothingToDistribute, "page treasury is empty");
  }
  if (participants.Empty()) {
    throw util::InvalidState(ErrorCode::kNoParticipants, "page has no participants");
  }

  const auto index = SelectParticipantIndex(context, caller, balance, participants.Size());
  return {participants.At(index), balance};
}

} // namespace pagereg::treasury
