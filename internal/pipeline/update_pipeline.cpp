#include "update_pipeline.hpp"

#include <string>

#include "internal/treasury/fee_treasury.hpp"
#include "internal/util/errors.hpp"

namespace pagereg::pipeline {

using util::ErrorCode;

SubmitOutcome UpdatePipeline::Submit(model::Page& page, const policy::OwnershipPolicy& policy,
                                     const model::ProposedFields& proposed, model::Amount paid,
                                     const model::Principal& caller, participants::ParticipantLedger& participants,
                                     std::uint64_t now_ms) const {
  if (page.immutable) {
    throw util::InvalidState(ErrorCode::kPageFrozen, "page " + std::to_string(page.id) + " is immutable");
  }
  if (paid < page.update_fee) {
    throw util::InvalidArgument(ErrorCode::kInsufficientFee,
                                "update fee is " + std::to_string(page.update_fee) + ", paid " + std::to_string(paid));
  }
  if (proposed.Empty()) {
    throw util::InvalidArgument(ErrorCode::kEmptyUpdate, "update proposes no non-empty field");
  }
  if (proposed.HasContent() && !validator_.IsValidContent(*proposed.content)) {
    throw util::InvalidArgument(ErrorCode::kInvalidContentFormat, "proposed content has an invalid format");
  }
  if (proposed.HasThumbnail() && !validator_.IsValidThumbnail(*proposed.thumbnail)) {
    throw util::InvalidArgument(ErrorCode::kInvalidContentFormat, "proposed thumbnail has an invalid format");
  }

  const auto credited = treasury::Credit(page.balance, paid);

  SubmitOutcome outcome;
  outcome.request.page_id       = page.id;
  outcome.request.proposer      = caller;
  outcome.request.proposed      = proposed;
  outcome.request.created_at_ms = now_ms;

  page.balance = credited;

  if (!policy.ApprovalApplicable()) {
    Apply(page, proposed, now_ms);
    outcome.request.request_id     = 0;
    outcome.request.state          = model::RequestState::kExecuted;
    outcome.request.executed_at_ms = now_ms;
    outcome.executed               = true;
    outcome.new_participant        = participants.Record(caller);
    return outcome;
  }

  outcome.request.request_id = page.next_request_id++;
  outcome.request.state      = model::RequestState::kPending;
  page.updated_at_ms         = now_ms;
  return outcome;
}

ApproveOutcome UpdatePipeline::Approve(model::Page& page, const policy::OwnershipPolicy& policy,
                                       model::UpdateRequest& request, const model::Principal& caller,
                                       std::uint64_t now_ms) const {
  if (request.executed()) {
    throw util::InvalidState(ErrorCode::kAlreadyExecuted, "request " + std::to_string(request.request_id) + " already executed");
  }
  if (!policy.ApprovalApplicable()) {
    throw util::InvalidState(ErrorCode::kApprovalNotApplicable, "page " + std::to_string(page.id) + " takes no approvals");
  }
  if (!policy.IsAuthorized(caller)) {
    throw util::PermissionDenied("caller " + caller + " is not an owner of the page");
  }
  if (request.voters.contains(caller)) {
    throw util::InvalidState(ErrorCode::kDuplicateVote, "caller " + caller + " already approved this request");
  }

  request.voters.insert(caller);
  request.approval_count++;

  ApproveOutcome outcome;
  outcome.approval_count = request.approval_count;

  if (request.approval_count >= policy.RequiredApprovals() && model::CanTransition(request.state, model::RequestState::kExecuted)) {
    Apply(page, request.proposed, now_ms);
    request.state          = model::RequestState::kExecuted;
    request.executed_at_ms = now_ms;
    outcome.executed       = true;
  }
  return outcome;
}

void UpdatePipeline::Apply(model::Page& page, const model::ProposedFields& proposed, std::uint64_t now_ms) {
  if (proposed.HasContent()) {
    page.content = *proposed.content;
  }
  if (proposed.HasName()) {
    page.name = *proposed.name;
  }
  if (proposed.HasThumbnail()) {
    page.thumbnail = *proposed.thumbnail;
  }
  page.updated_at_ms = now_ms;
}

} // namespace pagereg::pipeline
