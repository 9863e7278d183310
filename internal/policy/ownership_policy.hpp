#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include "internal/model/ownership.hpp"
#include "internal/model/payout.hpp"

namespace pagereg::policy {

/*
  Ownership policy of a page.

  Every variant-specific decision (who may approve, how many approvals execute
  a request, how a withdrawal is split, whether the policy may change) is made
  here. Call sites never branch on the kind themselves.
*/
class OwnershipPolicy {
 public:
  virtual ~OwnershipPolicy() = default;

  virtual model::OwnershipKind Kind() const = 0;

  virtual bool IsAuthorized(const model::Principal& principal) const = 0;

  // Distinct approvals needed to execute an update request. 0 means updates
  // execute on submission and approvals are not applicable.
  virtual std::uint32_t RequiredApprovals() const = 0;

  // Splits a withdrawal. Throws util::InvalidState(kNotWithdrawable) when the
  // policy has no withdrawal concept.
  virtual model::PayoutSplit PayoutShares(model::Amount balance) const = 0;

  // Only Single pages may move to another policy.
  virtual bool AllowsTransition() const = 0;

  bool ApprovalApplicable() const {
    return RequiredApprovals() > 0;
  }

  const model::OwnershipConfig& Config() const {
    return config_;
  }

 protected:
  explicit OwnershipPolicy(model::OwnershipConfig config) : config_(std::move(config)) {
  }

  model::OwnershipConfig config_;
};

// Throws util::InvalidArgument with kInvalidVariant for an unknown kind and
// kInvalidConfig when owners/threshold do not fit the kind.
void ValidateNew(const model::OwnershipConfig& config);

// Validates, then builds the policy for the kind.
std::unique_ptr<OwnershipPolicy> MakePolicy(model::OwnershipConfig config);

// Replaces the current policy. Throws util::InvalidState(kTransitionNotAllowed)
// unless the current policy allows it; the new config is validated as new.
std::unique_ptr<OwnershipPolicy> Transition(const OwnershipPolicy& current, model::OwnershipConfig next);

} // namespace pagereg::policy
