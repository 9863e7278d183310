#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace pagereg::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static Result WriteOwners(sqlite3* db, const model::PageRecord& r);
};

}
