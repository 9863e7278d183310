#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/page_record.hpp"
#include "internal/db/model/reaction_record.hpp"
#include "internal/db/model/update_request_record.hpp"

namespace pagereg::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Nothing written is visible to other transactions before Commit()
  - A transaction that is not committed leaves no trace

  The registry relies on the last point for fund safety: a rejected payout
  discards the balance debit together with everything else the operation
  staged.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Pages
  // ---------------------------------------------------------------------

  virtual Result InsertPage(Transaction&, const model::PageRecord&) = 0;

  virtual std::optional<model::PageRecord> GetPage(Transaction&, uint64_t page_id) = 0;

  virtual Result UpdatePage(Transaction&, const model::PageRecord&) = 0;

  virtual uint64_t CountPages(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Update requests
  // ---------------------------------------------------------------------

  virtual Result InsertUpdateRequest(Transaction&, const model::UpdateRequestRecord&) = 0;

  virtual std::optional<model::UpdateRequestRecord> GetUpdateRequest(Transaction&, uint64_t page_id, uint64_t request_id) = 0;

  virtual Result UpdateUpdateRequest(Transaction&, const model::UpdateRequestRecord&) = 0;

  // AlreadyExists if the principal already approved this request.
  virtual Result InsertApproval(Transaction&, uint64_t page_id, uint64_t request_id, const std::string& principal) = 0;

  // In approval order.
  virtual std::vector<std::string> ListApprovals(Transaction&, uint64_t page_id, uint64_t request_id) = 0;

  // ---------------------------------------------------------------------
  // Participants
  // ---------------------------------------------------------------------

  // AlreadyExists if the principal is already recorded for the page.
  virtual Result AppendParticipant(Transaction&, uint64_t page_id, const std::string& principal) = 0;

  // In first-submission order.
  virtual std::vector<std::string> ListParticipants(Transaction&, uint64_t page_id) = 0;

  // ---------------------------------------------------------------------
  // Reactions
  // ---------------------------------------------------------------------

  virtual Result UpsertReaction(Transaction&, const model::ReactionRecord&) = 0;

  virtual std::optional<model::ReactionRecord> GetReaction(Transaction&, uint64_t page_id, const std::string& principal) = 0;
};

} // namespace pagereg::db
