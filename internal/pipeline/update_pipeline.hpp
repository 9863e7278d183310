#pragma once

#include <cstdint>

#include "internal/content/content_validator.hpp"
#include "internal/model/page.hpp"
#include "internal/participants/participant_ledger.hpp"
#include "internal/policy/ownership_policy.hpp"

namespace pagereg::pipeline {

struct SubmitOutcome {
  model::UpdateRequest request;
  // Permissionless submissions execute immediately and are not stored.
  bool executed        = false;
  bool new_participant = false;
};

struct ApproveOutcome {
  std::uint32_t approval_count = 0;
  bool          executed       = false;
};

/*
  Submit / approve state machine over one page.

  Works on loaded domain objects only. The caller resolves the page and the
  request (PageNotFound, InvalidRequest) and persists whatever was mutated.
  Every check runs before the first mutation, so a throw leaves the inputs
  untouched.
*/
class UpdatePipeline {
 public:
  explicit UpdatePipeline(const content::ContentValidator& validator) : validator_(validator) {
  }

  // Checks: PageFrozen, InsufficientFee, EmptyUpdate, InvalidContentFormat,
  // BalanceOverflow. Credits the full paid amount.
  SubmitOutcome Submit(model::Page& page, const policy::OwnershipPolicy& policy, const model::ProposedFields& proposed,
                       model::Amount paid, const model::Principal& caller, participants::ParticipantLedger& participants,
                       std::uint64_t now_ms) const;

  // Checks: AlreadyExecuted, ApprovalNotApplicable, Unauthorized, DuplicateVote.
  ApproveOutcome Approve(model::Page& page, const policy::OwnershipPolicy& policy, model::UpdateRequest& request,
                         const model::Principal& caller, std::uint64_t now_ms) const;

  // Copies every non-empty proposed field into the page.
  static void Apply(model::Page& page, const model::ProposedFields& proposed, std::uint64_t now_ms);

 private:
  const content::ContentValidator& validator_;
};

} // namespace pagereg::pipeline
