#pragma once

#include "internal/model/ownership.hpp"
#include "internal/model/payout.hpp"
#include "internal/participants/participant_ledger.hpp"
#include "internal/policy/ownership_policy.hpp"
#include "internal/treasury/entropy.hpp"

namespace pagereg::treasury {

/*
  Fee treasury rules for a single page balance.

  These only plan; the caller stages the debit in its transaction, hands the
  payouts to a PayoutGateway and commits once the gateway accepted them.
*/

// Throws util::InvalidArgument(kBalanceOverflow) if the sum does not fit.
model::Amount Credit(model::Amount balance, model::Amount paid);

// Check order: NotWithdrawable, NothingToWithdraw, Unauthorized.
model::PayoutSplit PlanWithdrawal(const policy::OwnershipPolicy& policy, model::Amount balance, const model::Principal& caller);

// Check order: NotPermissionless, NothingToDistribute, NoParticipants.
// The whole balance goes to one participant.
model::Payout PlanDistribution(const policy::OwnershipPolicy& policy, model::Amount balance,
                               const participants::ParticipantLedger& participants, const BlockContext& context,
                               const model::Principal& caller);

} // namespace pagereg::treasury
