#pragma once

#include <string>

#include "pagereg/v1.hpp"
#include "service_context.hpp"

namespace pagereg::service {

/*
  Proto-in / proto-out facade over PageRegistry.

  The caller principal is passed explicitly; transports extract it from their
  own metadata. Every call is traced, counted and timed; failures are logged
  and rethrown unchanged.
*/
class PageService {
public:
  explicit PageService(ServiceContext ctx);

  pagereg::v1::CreatePageResponse
  CreatePage(const pagereg::v1::CreatePageRequest& req, const std::string& caller);

  pagereg::v1::RequestUpdateResponse
  RequestUpdate(const pagereg::v1::RequestUpdateRequest& req, const std::string& caller);

  pagereg::v1::ApproveRequestResponse
  ApproveRequest(const pagereg::v1::ApproveRequestRequest& req, const std::string& caller);

  pagereg::v1::WithdrawPageFeesResponse
  WithdrawPageFees(const pagereg::v1::WithdrawPageFeesRequest& req, const std::string& caller);

  pagereg::v1::DistributePageTreasuryResponse
  DistributePageTreasury(const pagereg::v1::DistributePageTreasuryRequest& req, const std::string& caller);

  void ChangeOwnership(const pagereg::v1::ChangeOwnershipRequest& req, const std::string& caller);

  pagereg::v1::VoteResponse
  Vote(const pagereg::v1::VoteRequest& req, const std::string& caller);

  pagereg::v1::PageInfo
  GetPageInfo(const pagereg::v1::GetPageInfoRequest& req);

  pagereg::v1::GetCurrentContentResponse
  GetCurrentContent(const pagereg::v1::GetCurrentContentRequest& req);

  pagereg::v1::GetOwnersResponse
  GetOwners(const pagereg::v1::GetOwnersRequest& req);

  pagereg::v1::UpdateRequest
  GetUpdateRequest(const pagereg::v1::GetUpdateRequestRequest& req);

  pagereg::v1::GetBalanceResponse
  GetBalance(const pagereg::v1::GetBalanceRequest& req);

  pagereg::v1::GetPageCountResponse
  GetPageCount(const pagereg::v1::GetPageCountRequest& req);

  pagereg::v1::GetParticipantsResponse
  GetParticipants(const pagereg::v1::GetParticipantsRequest& req);

  pagereg::v1::GetVoteRecordResponse
  GetVoteRecord(const pagereg::v1::GetVoteRecordRequest& req);

  pagereg::v1::GetAccountBalanceResponse
  GetAccountBalance(const pagereg::v1::GetAccountBalanceRequest& req);

private:
  ServiceContext ctx_;
};

}
