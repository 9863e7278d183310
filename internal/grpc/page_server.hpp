#pragma once

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>

#include "pagereg/v1/page_registry_service.grpc.pb.h"
#include "internal/service/page_service.hpp"
#include "pagereg/v1.hpp"

namespace pagereg::grpc {

// Metadata key carrying the calling principal.
inline constexpr const char* kCallerMetadataKey = "x-pagereg-caller";

std::string CallerFromContext(const ::grpc::ServerContext* ctx);

class PageServer final : public pagereg::v1::PageRegistryService::Service {
public:
  explicit PageServer(std::shared_ptr<pagereg::service::PageService> svc);

  ::grpc::Status CreatePage(::grpc::ServerContext*,
                        const pagereg::v1::CreatePageRequest*,
                        pagereg::v1::CreatePageResponse*) override;

  ::grpc::Status RequestUpdate(::grpc::ServerContext*,
                        const pagereg::v1::RequestUpdateRequest*,
                        pagereg::v1::RequestUpdateResponse*) override;

  ::grpc::Status ApproveRequest(::grpc::ServerContext*,
                        const pagereg::v1::ApproveRequestRequest*,
                        pagereg::v1::ApproveRequestResponse*) override;

  ::grpc::Status WithdrawPageFees(::grpc::ServerContext*,
                        const pagereg::v1::WithdrawPageFeesRequest*,
                        pagereg::v1::WithdrawPageFeesResponse*) override;

  ::grpc::Status DistributePageTreasury(::grpc::ServerContext*,
                        const pagereg::v1::DistributePageTreasuryRequest*,
                        pagereg::v1::DistributePageTreasuryResponse*) override;

  ::grpc::Status ChangeOwnership(::grpc::ServerContext*,
                        const pagereg::v1::ChangeOwnershipRequest*,
                        google::protobuf::Empty*) override;

  ::grpc::Status Vote(::grpc::ServerContext*,
                        const pagereg::v1::VoteRequest*,
                        pagereg::v1::VoteResponse*) override;

  ::grpc::Status GetPageInfo(::grpc::ServerContext*,
                        const pagereg::v1::GetPageInfoRequest*,
                        pagereg::v1::PageInfo*) override;

  ::grpc::Status GetCurrentContent(::grpc::ServerContext*,
                        const pagereg::v1::GetCurrentContentRequest*,
                        pagereg::v1::GetCurrentContentResponse*) override;

  ::grpc::Status GetOwners(::grpc::ServerContext*,
                        const pagereg::v1::GetOwnersRequest*,
                        pagereg::v1::GetOwnersResponse*) override;

  ::grpc::Status GetUpdateRequest(::grpc::ServerContext*,
                        const pagereg::v1::GetUpdateRequestRequest*,
                        pagereg::v1::UpdateRequest*) override;

  ::grpc::Status GetBalance(::grpc::ServerContext*,
                        const pagereg::v1::GetBalanceRequest*,
                        pagereg::v1::GetBalanceResponse*) override;

  ::grpc::Status GetPageCount(::grpc::ServerContext*,
                        const pagereg::v1::GetPageCountRequest*,
                        pagereg::v1::GetPageCountResponse*) override;

  ::grpc::Status GetParticipants(::grpc::ServerContext*,
                        const pagereg::v1::GetParticipantsRequest*,
                        pagereg::v1::GetParticipantsResponse*) override;

  ::grpc::Status GetVoteRecord(::grpc::ServerContext*,
                        const pagereg::v1::GetVoteRecordRequest*,
                        pagereg::v1::GetVoteRecordResponse*) override;

  ::grpc::Status GetAccountBalance(::grpc::ServerContext*,
                        const pagereg::v1::GetAccountBalanceRequest*,
                        pagereg::v1::GetAccountBalanceResponse*) override;

private:
  std::shared_ptr<pagereg::service::PageService> service_;
};

}
