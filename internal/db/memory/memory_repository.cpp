#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace pagereg::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Pages
// ------------------------------------------------------------------

Result MemoryRepository::InsertPage(Transaction& t, const model::PageRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.pages.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "page " + std::to_string(r.id));
  s.pages[r.id] = r;
  return Result::Ok();
}

std::optional<model::PageRecord> MemoryRepository::GetPage(Transaction& t, uint64_t page_id) {
  const auto& s  = TX(t).View();
  auto        it = s.pages.find(page_id);
  if (it == s.pages.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdatePage(Transaction& t, const model::PageRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.pages.find(r.id);
  if (it == s.pages.end()) return Result::Err(ErrorCode::NotFound, "page " + std::to_string(r.id));
  it->second = r;
  return Result::Ok();
}

uint64_t MemoryRepository::CountPages(Transaction& t) {
  return static_cast<uint64_t>(TX(t).View().pages.size());
}

// ------------------------------------------------------------------
// Update requests
// ------------------------------------------------------------------

Result MemoryRepository::InsertUpdateRequest(Transaction& t, const model::UpdateRequestRecord& r) {
  auto&            s = TX(t).Mutable();
  const RequestKey key{r.page_id, r.request_id};
  if (!s.pages.contains(r.page_id)) return Result::Err(ErrorCode::NotFound, "page " + std::to_string(r.page_id));
  if (s.requests.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "update request");
  s.requests[key] = r;
  return Result::Ok();
}

std::optional<model::UpdateRequestRecord> MemoryRepository::GetUpdateRequest(Transaction& t, uint64_t page_id, uint64_t request_id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find({page_id, request_id});
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateUpdateRequest(Transaction& t, const model::UpdateRequestRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.requests.find({r.page_id, r.request_id});
  if (it == s.requests.end()) return Result::Err(ErrorCode::NotFound, "update request");
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::InsertApproval(Transaction& t, uint64_t page_id, uint64_t request_id, const std::string& principal) {
  auto&            s = TX(t).Mutable();
  const RequestKey key{page_id, request_id};
  if (!s.requests.contains(key)) return Result::Err(ErrorCode::NotFound, "update request");

  auto& voters = s.approvals[key];
  if (std::find(voters.begin(), voters.end(), principal) != voters.end()) {
    return Result::Err(ErrorCode::AlreadyExists, "approval by " + principal);
  }
  voters.push_back(principal);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListApprovals(Transaction& t, uint64_t page_id, uint64_t request_id) {
  const auto& s  = TX(t).View();
  auto        it = s.approvals.find({page_id, request_id});
  if (it == s.approvals.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Participants
// ------------------------------------------------------------------

Result MemoryRepository::AppendParticipant(Transaction& t, uint64_t page_id, const std::string& principal) {
  auto& s = TX(t).Mutable();
  if (!s.pages.contains(page_id)) return Result::Err(ErrorCode::NotFound, "page " + std::to_string(page_id));

  auto& participants = s.participants[page_id];
  if (std::find(participants.begin(), participants.end(), principal) != participants.end()) {
    return Result::Err(ErrorCode::AlreadyExists, "participant " + principal);
  }
  participants.push_back(principal);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListParticipants(Transaction& t, uint64_t page_id) {
  const auto& s  = TX(t).View();
  auto        it = s.participants.find(page_id);
  if (it == s.participants.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Reactions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertReaction(Transaction& t, const model::ReactionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.pages.contains(r.page_id)) return Result::Err(ErrorCode::NotFound, "page " + std::to_string(r.page_id));
  s.reactions[{r.page_id, r.principal}] = r;
  return Result::Ok();
}

std::optional<model::ReactionRecord> MemoryRepository::GetReaction(Transaction& t, uint64_t page_id, const std::string& principal) {
  const auto& s  = TX(t).View();
  auto        it = s.reactions.find({page_id, principal});
  if (it == s.reactions.end()) return std::nullopt;
  return it->second;
}

} // namespace pagereg::db::memory
