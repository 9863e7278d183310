#include "page_registry.hpp"

#include <exception>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/participants/participant_ledger.hpp"
#include "internal/policy/ownership_policy.hpp"
#include "internal/treasury/fee_treasury.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace pagereg::registry {

using observability::StringField;
using observability::UintField;
using util::ErrorCode;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(ErrorCode::kPageNotFound, message);
    default:
      throw util::StorageError(message);
  }
}

db::model::PageRecord ToPageRecord(const model::Page& page) {
  db::model::PageRecord record;
  record.id                 = page.id;
  record.name               = page.name;
  record.thumbnail          = page.thumbnail;
  record.content            = page.content;
  record.immutable          = page.immutable;
  record.update_fee         = page.update_fee;
  record.ownership_kind     = static_cast<int>(page.ownership.kind);
  record.owners             = page.ownership.owners;
  record.threshold          = page.ownership.threshold;
  record.balance            = page.balance;
  record.retained_remainder = page.retained_remainder;
  record.next_request_id    = page.next_request_id;
  record.likes              = page.likes;
  record.dislikes           = page.dislikes;
  record.created_at_ms      = page.created_at_ms;
  record.updated_at_ms      = page.updated_at_ms;
  return record;
}

model::Page ToPage(const db::model::PageRecord& record) {
  model::Page page;
  page.id                  = record.id;
  page.name                = record.name;
  page.thumbnail           = record.thumbnail;
  page.content             = record.content;
  page.immutable           = record.immutable;
  page.update_fee          = record.update_fee;
  page.ownership.kind      = static_cast<model::OwnershipKind>(record.ownership_kind);
  page.ownership.owners    = record.owners;
  page.ownership.threshold = record.threshold;
  page.balance             = record.balance;
  page.retained_remainder  = record.retained_remainder;
  page.next_request_id     = record.next_request_id;
  page.likes               = record.likes;
  page.dislikes            = record.dislikes;
  page.created_at_ms       = record.created_at_ms;
  page.updated_at_ms       = record.updated_at_ms;
  return page;
}

db::model::UpdateRequestRecord ToRequestRecord(const model::UpdateRequest& request) {
  db::model::UpdateRequestRecord record;
  record.page_id        = request.page_id;
  record.request_id     = request.request_id;
  record.proposer       = request.proposer;
  record.content        = request.proposed.content;
  record.name           = request.proposed.name;
  record.thumbnail      = request.proposed.thumbnail;
  record.executed       = request.executed();
  record.approval_count = request.approval_count;
  record.created_at_ms  = request.created_at_ms;
  record.executed_at_ms = request.executed_at_ms;
  return record;
}

model::UpdateRequest ToRequest(const db::model::UpdateRequestRecord& record, const std::vector<std::string>& voters) {
  model::UpdateRequest request;
  request.page_id            = record.page_id;
  request.request_id         = record.request_id;
  request.proposer           = record.proposer;
  request.proposed.content   = record.content;
  request.proposed.name      = record.name;
  request.proposed.thumbnail = record.thumbnail;
  request.state              = record.executed ? model::RequestState::kExecuted : model::RequestState::kPending;
  request.approval_count     = record.approval_count;
  request.voters.insert(voters.begin(), voters.end());
  request.created_at_ms  = record.created_at_ms;
  request.executed_at_ms = record.executed_at_ms;
  return request;
}

model::VoteRecord ToVoteRecord(const db::model::ReactionRecord& record) {
  return {record.page_id, record.principal, record.liked, record.disliked};
}

std::uint64_t SaturatingDecrement(std::uint64_t value) {
  return value == 0 ? 0 : value - 1;
}

events::PageEvent MakeEvent(events::EventKind kind, model::PageId page_id, const model::Principal& principal,
                            model::Amount amount = 0) {
  events::PageEvent event;
  event.kind      = kind;
  event.page_id   = page_id;
  event.principal = principal;
  event.amount    = amount;
  return event;
}

events::PageEvent MakeRequestEvent(events::EventKind kind, model::PageId page_id, model::RequestId request_id,
                                   const model::Principal& principal, model::Amount amount = 0) {
  auto event        = MakeEvent(kind, page_id, principal, amount);
  event.request_id  = request_id;
  event.has_request = true;
  return event;
}

} // namespace

// Serializes operations and rejects calls made from inside one that is still
// in flight on the same thread.
class PageRegistry::OperationGuard {
 public:
  explicit OperationGuard(const PageRegistry& registry) : registry_(registry) {
    if (registry_.active_thread_.load() == std::this_thread::get_id()) {
      throw util::InvalidState(ErrorCode::kReentrantCall, "registry called from inside an operation in flight");
    }
    lock_ = std::unique_lock<std::mutex>(registry_.mutex_);
    registry_.active_thread_.store(std::this_thread::get_id());
  }

  ~OperationGuard() {
    registry_.active_thread_.store(std::thread::id{});
  }

  OperationGuard(const OperationGuard&)            = delete;
  OperationGuard& operator=(const OperationGuard&) = delete;

 private:
  const PageRegistry&          registry_;
  std::unique_lock<std::mutex> lock_;
};

PageRegistry::PageRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<const content::ContentValidator> validator,
                           std::shared_ptr<treasury::PayoutGateway> gateway, std::shared_ptr<treasury::Environment> environment,
                           std::shared_ptr<events::EventSink> events)
    : repository_(std::move(repository)),
      validator_(std::move(validator)),
      gateway_(std::move(gateway)),
      environment_(std::move(environment)),
      events_(std::move(events)),
      pipeline_(*validator_) {
}

model::Page PageRegistry::LoadPage(db::Transaction& tx, model::PageId page_id) const {
  auto record = repository_->GetPage(tx, page_id);
  if (!record.has_value()) {
    throw util::NotFound(ErrorCode::kPageNotFound, "page " + std::to_string(page_id) + " not found");
  }
  return ToPage(*record);
}

void PageRegistry::StorePage(db::Transaction& tx, const model::Page& page) {
  ThrowIfDbError(repository_->UpdatePage(tx, ToPageRecord(page)), "store page");
}

void PageRegistry::PayAndCommit(db::Transaction& tx, const std::vector<model::Payout>& batch) {
  if (!batch.empty()) {
    const auto outcome = gateway_->Transfer(batch);
    if (!outcome.accepted) {
      tx.Rollback();
      throw util::TransferFailed("payout rejected: " + outcome.reason);
    }
  }

  try {
    tx.Commit();
  } catch (const std::exception& e) {
    PAGEREG_LOG_ERROR("commit failed after payout was delivered", {StringField("error", e.what())});
    throw util::StorageError(std::string("commit after payout failed: ") + e.what());
  }
}

void PageRegistry::Publish(const std::vector<events::PageEvent>& emitted) {
  if (!events_) {
    return;
  }
  for (const auto& event : emitted) {
    try {
      events_->Emit(event);
    } catch (const std::exception& e) {
      PAGEREG_LOG_WARN("event sink failed", {StringField("event", events::EventKindName(event.kind)), StringField("error", e.what())});
    }
  }
}

// ------------------------------------------------------------------
// Mutations
// ------------------------------------------------------------------

model::PageId PageRegistry::CreatePage(const NewPage& request, const model::Principal& caller) {
  std::vector<events::PageEvent> emitted;
  model::PageId                  page_id = 0;
  {
    OperationGuard guard(*this);

    if (request.name.empty()) {
      throw util::InvalidArgument(ErrorCode::kInvalidArgument, "page name must not be empty");
    }
    if (!validator_->IsValidThumbnail(request.thumbnail)) {
      throw util::InvalidArgument(ErrorCode::kInvalidContentFormat, "thumbnail has an invalid format");
    }
    if (!validator_->IsValidContent(request.content)) {
      throw util::InvalidArgument(ErrorCode::kInvalidContentFormat, "content has an invalid format");
    }
    policy::ValidateNew(request.ownership);

    auto tx = repository_->Begin();

    const auto now = util::NowMs();
    model::Page page;
    page.id            = repository_->CountPages(*tx) + 1;
    page.name          = request.name;
    page.thumbnail     = request.thumbnail;
    page.content       = request.content;
    page.immutable     = request.immutable;
    page.update_fee    = request.update_fee;
    page.ownership     = request.ownership;
    page.created_at_ms = now;
    page.updated_at_ms = now;

    ThrowIfDbError(repository_->InsertPage(*tx, ToPageRecord(page)), "create page");
    tx->Commit();

    page_id = page.id;
    auto event   = MakeEvent(events::EventKind::kPageCreated, page_id, caller);
    event.detail = model::OwnershipKindName(page.ownership.kind);
    emitted.push_back(std::move(event));
  }

  PAGEREG_LOG_INFO("page created", {UintField("page_id", page_id), StringField("creator", caller)});
  Publish(emitted);
  return page_id;
}

SubmitResult PageRegistry::RequestUpdate(model::PageId page_id, const model::ProposedFields& proposed, model::Amount paid_fee,
                                         const model::Principal& caller) {
  std::vector<events::PageEvent> emitted;
  SubmitResult                   result;
  {
    OperationGuard guard(*this);
    auto           tx = repository_->Begin();

    auto page         = LoadPage(*tx, page_id);
    auto policy       = policy::MakePolicy(page.ownership);
    auto participants = participants::ParticipantLedger(repository_->ListParticipants(*tx, page_id));

    auto outcome = pipeline_.Submit(page, *policy, proposed, paid_fee, caller, participants, util::NowMs());

    StorePage(*tx, page);
    if (outcome.executed) {
      if (outcome.new_participant) {
        ThrowIfDbError(repository_->AppendParticipant(*tx, page_id, caller), "record participant");
      }
    } else {
      ThrowIfDbError(repository_->InsertUpdateRequest(*tx, ToRequestRecord(outcome.request)), "store update request");
    }
    tx->Commit();

    result.request_id = outcome.request.request_id;
    result.executed   = outcome.executed;

    emitted.push_back(MakeRequestEvent(events::EventKind::kUpdateRequested, page_id, result.request_id, caller, paid_fee));
    if (outcome.executed) {
      emitted.push_back(MakeRequestEvent(events::EventKind::kUpdateExecuted, page_id, result.request_id, caller));
    }
  }

  Publish(emitted);
  return result;
}

pipeline::ApproveOutcome PageRegistry::ApproveRequest(model::PageId page_id, model::RequestId request_id,
                                                      const model::Principal& caller) {
  std::vector<events::PageEvent> emitted;
  pipeline::ApproveOutcome       outcome;
  {
    OperationGuard guard(*this);
    auto           tx = repository_->Begin();

    auto page   = LoadPage(*tx, page_id);
    auto record = repository_->GetUpdateRequest(*tx, page_id, request_id);
    if (!record.has_value()) {
      throw util::NotFound(ErrorCode::kInvalidRequest,
                           "request " + std::to_string(request_id) + " not found on page " + std::to_string(page_id));
    }
    auto request = ToRequest(*record, repository_->ListApprovals(*tx, page_id, request_id));
    auto policy  = policy::MakePolicy(page.ownership);

    outcome = pipeline_.Approve(page, *policy, request, caller, util::NowMs());

    auto inserted = repository_->InsertApproval(*tx, page_id, request_id, caller);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      throw util::InvalidState(ErrorCode::kDuplicateVote, "caller " + caller + " already approved this request");
    }
    ThrowIfDbError(inserted, "record approval");
    ThrowIfDbError(repository_->UpdateUpdateRequest(*tx, ToRequestRecord(request)), "store update request");
    if (outcome.executed) {
      StorePage(*tx, page);
    }
    tx->Commit();

    emitted.push_back(MakeRequestEvent(events::EventKind::kApprovalRecorded, page_id, request_id, caller));
    if (outcome.executed) {
      emitted.push_back(MakeRequestEvent(events::EventKind::kUpdateExecuted, page_id, request_id, request.proposer));
    }
  }

  Publish(emitted);
  return outcome;
}

model::PayoutSplit PageRegistry::WithdrawPageFees(model::PageId page_id, const model::Principal& caller) {
  std::vector<events::PageEvent> emitted;
  model::PayoutSplit             split;
  {
    OperationGuard guard(*this);
    auto           tx = repository_->Begin();

    auto page   = LoadPage(*tx, page_id);
    auto policy = policy::MakePolicy(page.ownership);

    split = treasury::PlanWithdrawal(*policy, page.balance, caller);

    // Debit first; the transfer below sees the page already emptied.
    page.retained_remainder = treasury::Credit(page.retained_remainder, split.remainder);
    page.balance            = 0;
    page.updated_at_ms      = util::NowMs();
    StorePage(*tx, page);

    PayAndCommit(*tx, split.payouts);

    for (const auto& payout : split.payouts) {
      emitted.push_back(MakeEvent(events::EventKind::kFeesWithdrawn, page_id, payout.recipient, payout.amount));
    }
  }

  observability::Metrics::Instance().RecordPayout("withdraw", split.Total());
  PAGEREG_LOG_INFO("fees withdrawn", {UintField("page_id", page_id), StringField("caller", caller), UintField("paid", split.Total()),
                                      UintField("retained", split.remainder)});
  Publish(emitted);
  return split;
}

model::Payout PageRegistry::DistributePageTreasury(model::PageId page_id, const model::Principal& caller) {
  std::vector<events::PageEvent> emitted;
  model::Payout                  payout;
  {
    OperationGuard guard(*this);
    auto           tx = repository_->Begin();

    auto page         = LoadPage(*tx, page_id);
    auto policy       = policy::MakePolicy(page.ownership);
    auto participants = participants::ParticipantLedger(repository_->ListParticipants(*tx, page_id));

    payout = treasury::PlanDistribution(*policy, page.balance, participants, environment_->Current(), caller);

    page.balance       = 0;
    page.updated_at_ms = util::NowMs();
    StorePage(*tx, page);

    PayAndCommit(*tx, {payout});

    auto event   = MakeEvent(events::EventKind::kTreasuryDistributed, page_id, payout.recipient, payout.amount);
    event.detail = "triggered_by=" + caller;
    emitted.push_back(std::move(event));
  }

  observability::Metrics::Instance().RecordPayout("distribute", payout.amount);
  PAGEREG_LOG_INFO("treasury distributed",
                   {UintField("page_id", page_id), StringField("recipient", payout.recipient), UintField("amount", payout.amount)});
  Publish(emitted);
  return payout;
}

void PageRegistry::ChangeOwnership(model::PageId page_id, model::OwnershipConfig ownership, const model::Principal& caller) {
  std::vector<events::PageEvent> emitted;
  {
    OperationGuard guard(*this);
    auto           tx = repository_->Begin();

    auto page    = LoadPage(*tx, page_id);
    auto current = policy::MakePolicy(page.ownership);

    // Transition() rejects a non-transferable policy before anyone is asked.
    if (current->AllowsTransition() && !current->IsAuthorized(caller)) {
      throw util::PermissionDenied("caller " + caller + " is not the owner of the page");
    }
    auto next = policy::Transition(*current, std::move(ownership));

    page.ownership     = next->Config();
    page.updated_at_ms = util::NowMs();
    StorePage(*tx, page);
    tx->Commit();

    auto event   = MakeEvent(events::EventKind::kOwnershipChanged, page_id, caller);
    event.detail = model::OwnershipKindName(next->Kind());
    emitted.push_back(std::move(event));
  }

  Publish(emitted);
}

VoteResult PageRegistry::Vote(model::PageId page_id, model::ReactionKind kind, const model::Principal& caller) {
  std::vector<events::PageEvent> emitted;
  VoteResult                     result;
  {
    OperationGuard guard(*this);

    if (kind != model::ReactionKind::kLike && kind != model::ReactionKind::kDislike) {
      throw util::InvalidArgument(ErrorCode::kInvalidArgument, "unknown reaction kind");
    }

    auto tx   = repository_->Begin();
    auto page = LoadPage(*tx, page_id);

    db::model::ReactionRecord reaction;
    reaction.page_id   = page_id;
    reaction.principal = caller;
    if (auto existing = repository_->GetReaction(*tx, page_id, caller)) {
      reaction = *existing;
    }

    bool& same     = kind == model::ReactionKind::kLike ? reaction.liked : reaction.disliked;
    bool& opposite = kind == model::ReactionKind::kLike ? reaction.disliked : reaction.liked;
    auto& same_counter     = kind == model::ReactionKind::kLike ? page.likes : page.dislikes;
    auto& opposite_counter = kind == model::ReactionKind::kLike ? page.dislikes : page.likes;

    if (same) {
      same         = false;
      same_counter = SaturatingDecrement(same_counter);
    } else {
      same = true;
      same_counter++;
      if (opposite) {
        opposite         = false;
        opposite_counter = SaturatingDecrement(opposite_counter);
      }
    }

    ThrowIfDbError(repository_->UpsertReaction(*tx, reaction), "store reaction");
    StorePage(*tx, page);
    tx->Commit();

    result.record   = ToVoteRecord(reaction);
    result.likes    = page.likes;
    result.dislikes = page.dislikes;

    auto event   = MakeEvent(events::EventKind::kVoteChanged, page_id, caller);
    event.detail = std::string("liked=") + (reaction.liked ? "true" : "false") + " disliked=" + (reaction.disliked ? "true" : "false");
    emitted.push_back(std::move(event));
  }

  Publish(emitted);
  return result;
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

model::Page PageRegistry::GetPageInfo(model::PageId page_id) const {
  OperationGuard guard(*this);
  auto           tx   = repository_->Begin();
  auto           page = LoadPage(*tx, page_id);
  tx->Commit();
  return page;
}

std::string PageRegistry::GetCurrentContent(model::PageId page_id) const {
  return GetPageInfo(page_id).content;
}

model::OwnershipConfig PageRegistry::GetOwners(model::PageId page_id) const {
  return GetPageInfo(page_id).ownership;
}

model::UpdateRequest PageRegistry::GetUpdateRequest(model::PageId page_id, model::RequestId request_id) const {
  OperationGuard guard(*this);
  auto           tx = repository_->Begin();

  LoadPage(*tx, page_id);
  auto record = repository_->GetUpdateRequest(*tx, page_id, request_id);
  if (!record.has_value()) {
    throw util::NotFound(ErrorCode::kInvalidRequest,
                         "request " + std::to_string(request_id) + " not found on page " + std::to_string(page_id));
  }
  auto request = ToRequest(*record, repository_->ListApprovals(*tx, page_id, request_id));
  tx->Commit();
  return request;
}

model::Amount PageRegistry::GetBalance(model::PageId page_id) const {
  return GetPageInfo(page_id).balance;
}

std::uint64_t PageRegistry::GetPageCount() const {
  OperationGuard guard(*this);
  auto           tx    = repository_->Begin();
  const auto     count = repository_->CountPages(*tx);
  tx->Commit();
  return count;
}

std::vector<model::Principal> PageRegistry::GetParticipants(model::PageId page_id) const {
  OperationGuard guard(*this);
  auto           tx = repository_->Begin();

  LoadPage(*tx, page_id);
  auto participants = repository_->ListParticipants(*tx, page_id);
  tx->Commit();
  return participants;
}

model::VoteRecord PageRegistry::GetVoteRecord(model::PageId page_id, const model::Principal& principal) const {
  OperationGuard guard(*this);
  auto           tx = repository_->Begin();

  LoadPage(*tx, page_id);
  model::VoteRecord record{page_id, principal, false, false};
  if (auto existing = repository_->GetReaction(*tx, page_id, principal)) {
    record = ToVoteRecord(*existing);
  }
  tx->Commit();
  return record;
}

} // namespace pagereg::registry
