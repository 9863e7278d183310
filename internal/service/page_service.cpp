#include "page_service.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/model/page.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/page_registry.hpp"
#include "internal/treasury/account_ledger.hpp"
#include "internal/util/errors.hpp"

namespace pagereg::service {

using namespace pagereg::v1;

namespace {

constexpr std::uint64_t kNoPage = 0;

template <typename Fn>
auto ObserveRpc(std::string_view route, std::uint64_t page_id, Fn&& fn) {
  pagereg::observability::SpanScope span(route);
  if (page_id != kNoPage) {
    span.SetAttribute("page.id", static_cast<std::int64_t>(page_id));
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      pagereg::observability::Metrics::Instance().RecordRequest(route, true);
      pagereg::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return;
    } else {
      auto result = fn();
      pagereg::observability::Metrics::Instance().RecordRequest(route, true);
      pagereg::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    PAGEREG_LOG_ERROR("RPC failed", {pagereg::observability::StringField("route", route), pagereg::observability::StringField("error", ex.what()),
                                     pagereg::observability::UintField("page_id", page_id)});
    pagereg::observability::Metrics::Instance().RecordRequest(route, false);
    pagereg::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

void RequireCaller(const std::string& caller) {
  if (caller.empty()) {
    throw pagereg::util::InvalidArgument(pagereg::util::ErrorCode::kInvalidArgument, "caller principal is required");
  }
}

model::OwnershipKind ToModelKind(pagereg::v1::OwnershipKind kind) {
  switch (kind) {
    case OWNERSHIP_KIND_SINGLE:
      return model::OwnershipKind::kSingle;
    case OWNERSHIP_KIND_MULTISIG:
      return model::OwnershipKind::kMultiSig;
    case OWNERSHIP_KIND_PERMISSIONLESS:
      return model::OwnershipKind::kPermissionless;
    default:
      return model::OwnershipKind::kUnspecified;
  }
}

pagereg::v1::OwnershipKind ToProtoKind(model::OwnershipKind kind) {
  switch (kind) {
    case model::OwnershipKind::kSingle:
      return OWNERSHIP_KIND_SINGLE;
    case model::OwnershipKind::kMultiSig:
      return OWNERSHIP_KIND_MULTISIG;
    case model::OwnershipKind::kPermissionless:
      return OWNERSHIP_KIND_PERMISSIONLESS;
    default:
      return OWNERSHIP_KIND_UNSPECIFIED;
  }
}

model::OwnershipConfig ToModel(const pagereg::v1::OwnershipConfig& proto) {
  model::OwnershipConfig config;
  config.kind = ToModelKind(proto.kind());
  config.owners.assign(proto.owners().begin(), proto.owners().end());
  config.threshold = proto.threshold();
  return config;
}

void ToProto(const model::OwnershipConfig& config, pagereg::v1::OwnershipConfig* proto) {
  proto->set_kind(ToProtoKind(config.kind));
  for (const auto& owner : config.owners) {
    proto->add_owners(owner);
  }
  proto->set_threshold(config.threshold);
}

model::ProposedFields ToModel(const pagereg::v1::ProposedFields& proto) {
  model::ProposedFields fields;
  if (proto.has_content()) fields.content = proto.content();
  if (proto.has_name()) fields.name = proto.name();
  if (proto.has_thumbnail()) fields.thumbnail = proto.thumbnail();
  return fields;
}

void ToProto(const model::ProposedFields& fields, pagereg::v1::ProposedFields* proto) {
  if (fields.content) proto->set_content(*fields.content);
  if (fields.name) proto->set_name(*fields.name);
  if (fields.thumbnail) proto->set_thumbnail(*fields.thumbnail);
}

void ToProto(const model::Payout& payout, pagereg::v1::Payout* proto) {
  proto->set_recipient(payout.recipient);
  proto->set_amount(payout.amount);
}

PageInfo ToPageInfo(const model::Page& page) {
  PageInfo info;
  info.set_page_id(page.id);
  info.set_name(page.name);
  info.set_thumbnail(page.thumbnail);
  info.set_content(page.content);
  info.set_immutable(page.immutable);
  info.set_update_fee(page.update_fee);
  ToProto(page.ownership, info.mutable_ownership());
  info.set_balance(page.balance);
  info.set_retained_remainder(page.retained_remainder);
  info.set_request_count(page.next_request_id);
  info.set_likes(page.likes);
  info.set_dislikes(page.dislikes);
  info.set_created_at_ms(page.created_at_ms);
  info.set_updated_at_ms(page.updated_at_ms);
  return info;
}

pagereg::v1::UpdateRequest ToProto(const model::UpdateRequest& request) {
  pagereg::v1::UpdateRequest proto;
  proto.set_page_id(request.page_id);
  proto.set_request_id(request.request_id);
  proto.set_proposer(request.proposer);
  ToProto(request.proposed, proto.mutable_proposed());
  proto.set_executed(request.executed());
  proto.set_approval_count(request.approval_count);
  for (const auto& voter : request.voters) {
    proto.add_voters(voter);
  }
  proto.set_created_at_ms(request.created_at_ms);
  proto.set_executed_at_ms(request.executed_at_ms);
  return proto;
}

} // namespace

PageService::PageService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreatePageResponse PageService::CreatePage(const CreatePageRequest& req, const std::string& caller) {
  return ObserveRpc("PageService.CreatePage", kNoPage, [&] {
    RequireCaller(caller);

    registry::NewPage page;
    page.name       = req.name();
    page.thumbnail  = req.thumbnail();
    page.content    = req.content();
    page.ownership  = ToModel(req.ownership());
    page.update_fee = req.update_fee();
    page.immutable  = req.immutable();

    CreatePageResponse resp;
    resp.set_page_id(ctx_.registry->CreatePage(page, caller));
    return resp;
  });
}

RequestUpdateResponse PageService::RequestUpdate(const RequestUpdateRequest& req, const std::string& caller) {
  return ObserveRpc("PageService.RequestUpdate", req.page_id(), [&] {
    RequireCaller(caller);

    const auto result = ctx_.registry->RequestUpdate(req.page_id(), ToModel(req.proposed()), req.paid_fee(), caller);

    RequestUpdateResponse resp;
    resp.set_request_id(result.request_id);
    resp.set_executed(result.executed);
    return resp;
  });
}

ApproveRequestResponse PageService::ApproveRequest(const ApproveRequestRequest& req, const std::string& caller) {
  return ObserveRpc("PageService.ApproveRequest", req.page_id(), [&] {
    RequireCaller(caller);

    const auto outcome = ctx_.registry->ApproveRequest(req.page_id(), req.request_id(), caller);

    ApproveRequestResponse resp;
    resp.set_approval_count(outcome.approval_count);
    resp.set_executed(outcome.executed);
    return resp;
  });
}

WithdrawPageFeesResponse PageService::WithdrawPageFees(const WithdrawPageFeesRequest& req, const std::string& caller) {
  return ObserveRpc("PageService.WithdrawPageFees", req.page_id(), [&] {
    RequireCaller(caller);

    const auto split = ctx_.registry->WithdrawPageFees(req.page_id(), caller);

    WithdrawPageFeesResponse resp;
    for (const auto& payout : split.payouts) {
      ToProto(payout, resp.add_payouts());
    }
    resp.set_retained_remainder(split.remainder);
    return resp;
  });
}

DistributePageTreasuryResponse PageService::DistributePageTreasury(const DistributePageTreasuryRequest& req, const std::string& caller) {
  return ObserveRpc("PageService.DistributePageTreasury", req.page_id(), [&] {
    RequireCaller(caller);

    DistributePageTreasuryResponse resp;
    ToProto(ctx_.registry->DistributePageTreasury(req.page_id(), caller), resp.mutable_payout());
    return resp;
  });
}

void PageService::ChangeOwnership(const ChangeOwnershipRequest& req, const std::string& caller) {
  ObserveRpc("PageService.ChangeOwnership", req.page_id(), [&] {
    RequireCaller(caller);
    ctx_.registry->ChangeOwnership(req.page_id(), ToModel(req.ownership()), caller);
  });
}

VoteResponse PageService::Vote(const VoteRequest& req, const std::string& caller) {
  return ObserveRpc("PageService.Vote", req.page_id(), [&] {
    RequireCaller(caller);

    model::ReactionKind kind;
    switch (req.kind()) {
      case REACTION_KIND_LIKE:
        kind = model::ReactionKind::kLike;
        break;
      case REACTION_KIND_DISLIKE:
        kind = model::ReactionKind::kDislike;
        break;
      default:
        throw pagereg::util::InvalidArgument(pagereg::util::ErrorCode::kInvalidArgument, "vote kind must be LIKE or DISLIKE");
    }

    const auto result = ctx_.registry->Vote(req.page_id(), kind, caller);

    VoteResponse resp;
    resp.set_liked(result.record.liked);
    resp.set_disliked(result.record.disliked);
    resp.set_likes(result.likes);
    resp.set_dislikes(result.dislikes);
    return resp;
  });
}

PageInfo PageService::GetPageInfo(const GetPageInfoRequest& req) {
  return ObserveRpc("PageService.GetPageInfo", req.page_id(), [&] { return ToPageInfo(ctx_.registry->GetPageInfo(req.page_id())); });
}

GetCurrentContentResponse PageService::GetCurrentContent(const GetCurrentContentRequest& req) {
  return ObserveRpc("PageService.GetCurrentContent", req.page_id(), [&] {
    GetCurrentContentResponse resp;
    resp.set_content(ctx_.registry->GetCurrentContent(req.page_id()));
    return resp;
  });
}

GetOwnersResponse PageService::GetOwners(const GetOwnersRequest& req) {
  return ObserveRpc("PageService.GetOwners", req.page_id(), [&] {
    GetOwnersResponse resp;
    ToProto(ctx_.registry->GetOwners(req.page_id()), resp.mutable_ownership());
    return resp;
  });
}

pagereg::v1::UpdateRequest PageService::GetUpdateRequest(const GetUpdateRequestRequest& req) {
  return ObserveRpc("PageService.GetUpdateRequest", req.page_id(),
                    [&] { return ToProto(ctx_.registry->GetUpdateRequest(req.page_id(), req.request_id())); });
}

GetBalanceResponse PageService::GetBalance(const GetBalanceRequest& req) {
  return ObserveRpc("PageService.GetBalance", req.page_id(), [&] {
    GetBalanceResponse resp;
    resp.set_balance(ctx_.registry->GetBalance(req.page_id()));
    return resp;
  });
}

GetPageCountResponse PageService::GetPageCount(const GetPageCountRequest&) {
  return ObserveRpc("PageService.GetPageCount", kNoPage, [&] {
    GetPageCountResponse resp;
    resp.set_count(ctx_.registry->GetPageCount());
    return resp;
  });
}

GetParticipantsResponse PageService::GetParticipants(const GetParticipantsRequest& req) {
  return ObserveRpc("PageService.GetParticipants", req.page_id(), [&] {
    GetParticipantsResponse resp;
    for (const auto& participant : ctx_.registry->GetParticipants(req.page_id())) {
      resp.add_participants(participant);
    }
    return resp;
  });
}

GetVoteRecordResponse PageService::GetVoteRecord(const GetVoteRecordRequest& req) {
  return ObserveRpc("PageService.GetVoteRecord", req.page_id(), [&] {
    const auto record = ctx_.registry->GetVoteRecord(req.page_id(), req.principal());

    GetVoteRecordResponse resp;
    resp.set_liked(record.liked);
    resp.set_disliked(record.disliked);
    return resp;
  });
}

GetAccountBalanceResponse PageService::GetAccountBalance(const GetAccountBalanceRequest& req) {
  return ObserveRpc("PageService.GetAccountBalance", kNoPage, [&] {
    if (!ctx_.ledger) {
      throw pagereg::util::InvalidState(pagereg::util::ErrorCode::kInternal, "no account ledger configured");
    }

    GetAccountBalanceResponse resp;
    resp.set_balance(ctx_.ledger->Balance(req.account()));
    return resp;
  });
}

}
