#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/content/content_validator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/model/page.hpp"
#include "internal/model/payout.hpp"
#include "internal/pipeline/update_pipeline.hpp"
#include "internal/treasury/entropy.hpp"
#include "internal/treasury/payout_gateway.hpp"

namespace pagereg::registry {

struct NewPage {
  std::string            name;
  std::string            thumbnail;
  std::string            content;
  model::OwnershipConfig ownership;
  model::Amount          update_fee = 0;
  bool                   immutable  = false;
};

struct SubmitResult {
  model::RequestId request_id = 0;
  bool             executed   = false;
};

struct VoteResult {
  model::VoteRecord record;
  std::uint64_t     likes    = 0;
  std::uint64_t     dislikes = 0;
};

/*
  Directory of pages and the public operation surface.

  Every operation is serialized with all others and runs in one repository
  transaction. Operations that pay out call the gateway before committing and
  roll back everything when it refuses. A call made from inside the gateway
  (same thread, operation still in flight) fails with ReentrantCall.

  Events are published after the transaction committed.
*/
class PageRegistry {
 public:
  PageRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<const content::ContentValidator> validator,
               std::shared_ptr<treasury::PayoutGateway> gateway, std::shared_ptr<treasury::Environment> environment,
               std::shared_ptr<events::EventSink> events = nullptr);

  model::PageId CreatePage(const NewPage& page, const model::Principal& caller);

  SubmitResult RequestUpdate(model::PageId page_id, const model::ProposedFields& proposed, model::Amount paid_fee,
                             const model::Principal& caller);

  pipeline::ApproveOutcome ApproveRequest(model::PageId page_id, model::RequestId request_id, const model::Principal& caller);

  model::PayoutSplit WithdrawPageFees(model::PageId page_id, const model::Principal& caller);

  model::Payout DistributePageTreasury(model::PageId page_id, const model::Principal& caller);

  void ChangeOwnership(model::PageId page_id, model::OwnershipConfig ownership, const model::Principal& caller);

  // Toggles the caller's reaction. Liking clears a dislike and vice versa.
  VoteResult Vote(model::PageId page_id, model::ReactionKind kind, const model::Principal& caller);

  model::Page                   GetPageInfo(model::PageId page_id) const;
  std::string                   GetCurrentContent(model::PageId page_id) const;
  model::OwnershipConfig        GetOwners(model::PageId page_id) const;
  model::UpdateRequest          GetUpdateRequest(model::PageId page_id, model::RequestId request_id) const;
  model::Amount                 GetBalance(model::PageId page_id) const;
  std::uint64_t                 GetPageCount() const;
  std::vector<model::Principal> GetParticipants(model::PageId page_id) const;
  model::VoteRecord             GetVoteRecord(model::PageId page_id, const model::Principal& principal) const;

 private:
  class OperationGuard;

  model::Page LoadPage(db::Transaction& tx, model::PageId page_id) const;
  void        StorePage(db::Transaction& tx, const model::Page& page);

  // Hands the batch to the gateway and commits on acceptance. Otherwise rolls
  // back and throws TransferFailed.
  void PayAndCommit(db::Transaction& tx, const std::vector<model::Payout>& batch);

  void Publish(const std::vector<events::PageEvent>& emitted);

  std::shared_ptr<db::Repository>                 repository_;
  std::shared_ptr<const content::ContentValidator> validator_;
  std::shared_ptr<treasury::PayoutGateway>        gateway_;
  std::shared_ptr<treasury::Environment>          environment_;
  std::shared_ptr<events::EventSink>              events_;
  pipeline::UpdatePipeline                        pipeline_;

  mutable std::mutex                   mutex_;
  mutable std::atomic<std::thread::id> active_thread_{};
};

} // namespace pagereg::registry
