#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace pagereg::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertPage(Transaction&, const model::PageRecord&) override;
  std::optional<model::PageRecord> GetPage(Transaction&, uint64_t page_id) override;
  Result UpdatePage(Transaction&, const model::PageRecord&) override;
  uint64_t CountPages(Transaction&) override;

  Result InsertUpdateRequest(Transaction&, const model::UpdateRequestRecord&) override;
  std::optional<model::UpdateRequestRecord> GetUpdateRequest(Transaction&, uint64_t page_id,
                                                             uint64_t request_id) override;
  Result UpdateUpdateRequest(Transaction&, const model::UpdateRequestRecord&) override;
  Result InsertApproval(Transaction&, uint64_t page_id, uint64_t request_id,
                        const std::string& principal) override;
  std::vector<std::string> ListApprovals(Transaction&, uint64_t page_id, uint64_t request_id) override;

  Result AppendParticipant(Transaction&, uint64_t page_id, const std::string& principal) override;
  std::vector<std::string> ListParticipants(Transaction&, uint64_t page_id) override;

  Result UpsertReaction(Transaction&, const model::ReactionRecord&) override;
  std::optional<model::ReactionRecord> GetReaction(Transaction&, uint64_t page_id,
                                                   const std::string& principal) override;

private:
  friend class MemoryTransaction;

  using RequestKey = std::pair<uint64_t, uint64_t>;

  struct State {
    std::map<uint64_t, model::PageRecord> pages;
    std::map<RequestKey, model::UpdateRequestRecord> requests;
    std::map<RequestKey, std::vector<std::string>> approvals;
    std::unordered_map<uint64_t, std::vector<std::string>> participants;
    std::map<std::pair<uint64_t, std::string>, model::ReactionRecord> reactions;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
