#include "internal/service/page_service.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/registry/page_registry.hpp"
#include "internal/treasury/account_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

using pagereg::util::ErrorCode;

pagereg::service::ServiceContext BuildServiceContext() {
  pagereg::service::ServiceContext ctx;
  ctx.ledger   = std::make_shared<pagereg::treasury::AccountLedger>();
  ctx.registry = std::make_shared<pagereg::registry::PageRegistry>(
      std::make_shared<pagereg::db::memory::MemoryRepository>(), std::make_shared<pagereg::content::MarkerContentValidator>(),
      ctx.ledger, std::make_shared<pagereg::treasury::FixedEnvironment>());
  return ctx;
}

pagereg::v1::CreatePageRequest SinglePageRequest(const std::string& owner, std::uint64_t fee) {
  pagereg::v1::CreatePageRequest req;
  req.set_name("docs");
  req.set_thumbnail("ipfs://QmDocs");
  req.set_content("<html>docs</html>");
  req.set_update_fee(fee);
  req.mutable_ownership()->set_kind(pagereg::v1::OWNERSHIP_KIND_SINGLE);
  req.mutable_ownership()->add_owners(owner);
  req.mutable_ownership()->set_threshold(1);
  return req;
}

template <typename Exception, typename Fn>
ErrorCode ExpectError(Fn&& fn) {
  try {
    fn();
  } catch (const Exception& e) {
    return e.code();
  }
  assert(false && "expected an error");
  return ErrorCode::kInternal;
}

void TestSingleOwnerFlowThroughProtoSurface() {
  pagereg::service::PageService service(BuildServiceContext());

  const auto created = service.CreatePage(SinglePageRequest("alice", 1000), "alice");
  assert(created.page_id() == 1);

  pagereg::v1::RequestUpdateRequest update;
  update.set_page_id(created.page_id());
  update.mutable_proposed()->set_content("<html>docs v2</html>");
  update.set_paid_fee(1000);
  const auto submitted = service.RequestUpdate(update, "bob");
  assert(submitted.request_id() == 0);
  assert(!submitted.executed());

  pagereg::v1::GetUpdateRequestRequest get_request;
  get_request.set_page_id(created.page_id());
  get_request.set_request_id(0);
  const auto pending = service.GetUpdateRequest(get_request);
  assert(pending.proposer() == "bob");
  assert(pending.proposed().has_content());
  assert(!pending.proposed().has_name());
  assert(!pending.executed());

  pagereg::v1::ApproveRequestRequest approve;
  approve.set_page_id(created.page_id());
  approve.set_request_id(0);
  const auto approved = service.ApproveRequest(approve, "alice");
  assert(approved.executed());
  assert(approved.approval_count() == 1);

  pagereg::v1::GetCurrentContentRequest content_req;
  content_req.set_page_id(created.page_id());
  assert(service.GetCurrentContent(content_req).content() == "<html>docs v2</html>");

  pagereg::v1::GetPageInfoRequest info_req;
  info_req.set_page_id(created.page_id());
  const auto info = service.GetPageInfo(info_req);
  assert(info.name() == "docs");
  assert(info.balance() == 1000);
  assert(info.request_count() == 1);
  assert(info.ownership().kind() == pagereg::v1::OWNERSHIP_KIND_SINGLE);

  pagereg::v1::WithdrawPageFeesRequest withdraw;
  withdraw.set_page_id(created.page_id());
  const auto withdrawn = service.WithdrawPageFees(withdraw, "alice");
  assert(withdrawn.payouts_size() == 1);
  assert(withdrawn.payouts(0).recipient() == "alice");
  assert(withdrawn.payouts(0).amount() == 1000);
  assert(withdrawn.retained_remainder() == 0);

  pagereg::v1::GetAccountBalanceRequest account;
  account.set_account("alice");
  assert(service.GetAccountBalance(account).balance() == 1000);

  pagereg::v1::GetBalanceRequest balance;
  balance.set_page_id(created.page_id());
  assert(service.GetBalance(balance).balance() == 0);

  assert(service.GetPageCount(pagereg::v1::GetPageCountRequest{}).count() == 1);
}

void TestOwnershipAndVotesThroughProtoSurface() {
  pagereg::service::PageService service(BuildServiceContext());
  const auto                    page_id = service.CreatePage(SinglePageRequest("alice", 0), "alice").page_id();

  pagereg::v1::ChangeOwnershipRequest change;
  change.set_page_id(page_id);
  change.mutable_ownership()->set_kind(pagereg::v1::OWNERSHIP_KIND_MULTISIG);
  change.mutable_ownership()->add_owners("x");
  change.mutable_ownership()->add_owners("y");
  change.mutable_ownership()->set_threshold(2);
  service.ChangeOwnership(change, "alice");

  pagereg::v1::GetOwnersRequest owners_req;
  owners_req.set_page_id(page_id);
  const auto owners = service.GetOwners(owners_req);
  assert(owners.ownership().kind() == pagereg::v1::OWNERSHIP_KIND_MULTISIG);
  assert(owners.ownership().owners_size() == 2);
  assert(owners.ownership().threshold() == 2);

  pagereg::v1::VoteRequest vote;
  vote.set_page_id(page_id);
  vote.set_kind(pagereg::v1::REACTION_KIND_DISLIKE);
  const auto voted = service.Vote(vote, "fan");
  assert(voted.disliked() && !voted.liked());
  assert(voted.dislikes() == 1);

  pagereg::v1::GetVoteRecordRequest record_req;
  record_req.set_page_id(page_id);
  record_req.set_principal("fan");
  assert(service.GetVoteRecord(record_req).disliked());

  vote.set_kind(pagereg::v1::REACTION_KIND_UNSPECIFIED);
  assert(ExpectError<pagereg::util::InvalidArgument>([&] { (void)service.Vote(vote, "fan"); }) == ErrorCode::kInvalidArgument);
}

void TestPermissionlessParticipantsThroughProtoSurface() {
  pagereg::service::PageService service(BuildServiceContext());

  pagereg::v1::CreatePageRequest create;
  create.set_name("wiki");
  create.set_thumbnail("https://wiki/thumb.png");
  create.set_content("<html>wiki</html>");
  create.set_update_fee(1);
  create.mutable_ownership()->set_kind(pagereg::v1::OWNERSHIP_KIND_PERMISSIONLESS);
  const auto page_id = service.CreatePage(create, "founder").page_id();

  pagereg::v1::RequestUpdateRequest update;
  update.set_page_id(page_id);
  update.mutable_proposed()->set_name("wiki2");
  update.set_paid_fee(1);
  assert(service.RequestUpdate(update, "p1").executed());
  assert(service.RequestUpdate(update, "p2").executed());

  pagereg::v1::GetParticipantsRequest participants_req;
  participants_req.set_page_id(page_id);
  const auto participants = service.GetParticipants(participants_req);
  assert(participants.participants_size() == 2);
  assert(participants.participants(0) == "p1");

  pagereg::v1::DistributePageTreasuryRequest distribute;
  distribute.set_page_id(page_id);
  const auto distributed = service.DistributePageTreasury(distribute, "p1");
  assert(distributed.payout().amount() == 2);
}

void TestInvalidInputsSurfaceTypedErrors() {
  pagereg::service::PageService service(BuildServiceContext());

  assert(ExpectError<pagereg::util::InvalidArgument>([&] { (void)service.CreatePage(SinglePageRequest("alice", 0), ""); }) ==
         ErrorCode::kInvalidArgument);

  auto unknown_kind = SinglePageRequest("alice", 0);
  unknown_kind.mutable_ownership()->set_kind(pagereg::v1::OWNERSHIP_KIND_UNSPECIFIED);
  assert(ExpectError<pagereg::util::InvalidArgument>([&] { (void)service.CreatePage(unknown_kind, "alice"); }) ==
         ErrorCode::kInvalidVariant);

  pagereg::v1::GetPageInfoRequest missing;
  missing.set_page_id(404);
  assert(ExpectError<pagereg::util::NotFound>([&] { (void)service.GetPageInfo(missing); }) == ErrorCode::kPageNotFound);

  pagereg::service::ServiceContext no_ledger = BuildServiceContext();
  no_ledger.ledger.reset();
  pagereg::service::PageService without_ledger(no_ledger);
  assert(ExpectError<pagereg::util::InvalidState>([&] {
           (void)without_ledger.GetAccountBalance(pagereg::v1::GetAccountBalanceRequest{});
         }) == ErrorCode::kInternal);
}

} // namespace

int main() {
  TestSingleOwnerFlowThroughProtoSurface();
  TestOwnershipAndVotesThroughProtoSurface();
  TestPermissionlessParticipantsThroughProtoSurface();
  TestInvalidInputsSurfaceTypedErrors();

  std::cout << "pagereg_unit_page_service: pass\n";
  return 0;
}
