#include "page_server.hpp"
#include "grpc_error.hpp"
#include "pagereg/v1.hpp"

namespace pagereg::grpc {

std::string CallerFromContext(const ::grpc::ServerContext* ctx) {
  if (!ctx) {
    return {};
  }
  const auto& metadata = ctx->client_metadata();
  const auto  it       = metadata.find(kCallerMetadataKey);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

PageServer::PageServer(std::shared_ptr<pagereg::service::PageService> svc)
    : service_(std::move(svc)) {}

::grpc::Status PageServer::CreatePage(::grpc::ServerContext* ctx,
                                  const pagereg::v1::CreatePageRequest* req,
                                  pagereg::v1::CreatePageResponse* resp) {
  try {
    *resp = service_->CreatePage(*req, CallerFromContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::RequestUpdate(::grpc::ServerContext* ctx,
                                  const pagereg::v1::RequestUpdateRequest* req,
                                  pagereg::v1::RequestUpdateResponse* resp) {
  try {
    *resp = service_->RequestUpdate(*req, CallerFromContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::ApproveRequest(::grpc::ServerContext* ctx,
                                  const pagereg::v1::ApproveRequestRequest* req,
                                  pagereg::v1::ApproveRequestResponse* resp) {
  try {
    *resp = service_->ApproveRequest(*req, CallerFromContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::WithdrawPageFees(::grpc::ServerContext* ctx,
                                  const pagereg::v1::WithdrawPageFeesRequest* req,
                                  pagereg::v1::WithdrawPageFeesResponse* resp) {
  try {
    *resp = service_->WithdrawPageFees(*req, CallerFromContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::DistributePageTreasury(::grpc::ServerContext* ctx,
                                  const pagereg::v1::DistributePageTreasuryRequest* req,
                                  pagereg::v1::DistributePageTreasuryResponse* resp) {
  try {
    *resp = service_->DistributePageTreasury(*req, CallerFromContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::ChangeOwnership(::grpc::ServerContext* ctx,
                                  const pagereg::v1::ChangeOwnershipRequest* req,
                                  google::protobuf::Empty*) {
  try {
    service_->ChangeOwnership(*req, CallerFromContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::Vote(::grpc::ServerContext* ctx,
                                  const pagereg::v1::VoteRequest* req,
                                  pagereg::v1::VoteResponse* resp) {
  try {
    *resp = service_->Vote(*req, CallerFromContext(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::GetPageInfo(::grpc::ServerContext*,
                                  const pagereg::v1::GetPageInfoRequest* req,
                                  pagereg::v1::PageInfo* resp) {
  try {
    *resp = service_->GetPageInfo(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::GetCurrentContent(::grpc::ServerContext*,
                                  const pagereg::v1::GetCurrentContentRequest* req,
                                  pagereg::v1::GetCurrentContentResponse* resp) {
  try {
    *resp = service_->GetCurrentContent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::GetOwners(::grpc::ServerContext*,
                                  const pagereg::v1::GetOwnersRequest* req,
                                  pagereg::v1::GetOwnersResponse* resp) {
  try {
    *resp = service_->GetOwners(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::GetUpdateRequest(::grpc::ServerContext*,
                                  const pagereg::v1::GetUpdateRequestRequest* req,
                                  pagereg::v1::UpdateRequest* resp) {
  try {
    *resp = service_->GetUpdateRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::GetBalance(::grpc::ServerContext*,
                                  const pagereg::v1::GetBalanceRequest* req,
                                  pagereg::v1::GetBalanceResponse* resp) {
  try {
    *resp = service_->GetBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::GetPageCount(::grpc::ServerContext*,
                                  const pagereg::v1::GetPageCountRequest* req,
                                  pagereg::v1::GetPageCountResponse* resp) {
  try {
    *resp = service_->GetPageCount(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::GetParticipants(::grpc::ServerContext*,
                                  const pagereg::v1::GetParticipantsRequest* req,
                                  pagereg::v1::GetParticipantsResponse* resp) {
  try {
    *resp = service_->GetParticipants(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::GetVoteRecord(::grpc::ServerContext*,
                                  const pagereg::v1::GetVoteRecordRequest* req,
                                  pagereg::v1::GetVoteRecordResponse* resp) {
  try {
    *resp = service_->GetVoteRecord(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PageServer::GetAccountBalance(::grpc::ServerContext*,
                                  const pagereg::v1::GetAccountBalanceRequest* req,
                                  pagereg::v1::GetAccountBalanceResponse* resp) {
  try {
    *resp = service_->GetAccountBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
