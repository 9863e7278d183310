#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace pagereg::db::sqlite {

using pagereg::db::ErrorCode;
using pagereg::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s.has_value()) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

std::vector<std::string> ReadPrincipals(sqlite3* db, const char* sql, uint64_t page_id, std::optional<uint64_t> request_id) {
  std::vector<std::string> out;
  auto                     st = Prepare(db, sql);
  if (!st) return out;

  BindU64(st.get(), 1, page_id);
  if (request_id) BindU64(st.get(), 2, *request_id);

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ColText(st.get(), 0));
  }
  return out;
}

Result PrepareError(sqlite3* db) {
  return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Pages
// ------------------------------------------------------------------

Result SqliteRepository::WriteOwners(sqlite3* db, const model::PageRecord& r) {
  auto del = Prepare(db, sql::DELETE_OWNERS);
  if (!del) return PrepareError(db);
  BindU64(del.get(), 1, r.id);
  if (auto res = Translate(db, sqlite3_step(del.get())); !res) return res;

  for (std::size_t i = 0; i < r.owners.size(); ++i) {
    auto ins = Prepare(db, sql::INSERT_OWNER);
    if (!ins) return PrepareError(db);
    BindU64(ins.get(), 1, r.id);
    BindU64(ins.get(), 2, i);
    BindText(ins.get(), 3, r.owners[i]);
    if (auto res = Translate(db, sqlite3_step(ins.get())); !res) return res;
  }
  return Result::Ok();
}

Result SqliteRepository::InsertPage(Transaction& t, const model::PageRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::INSERT_PAGE);
  if (!st) return PrepareError(db);

  BindU64(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.thumbnail);
  BindText(st.get(), 4, r.content);
  BindBool(st.get(), 5, r.immutable);
  BindU64(st.get(), 6, r.update_fee);
  BindU64(st.get(), 7, static_cast<uint64_t>(r.ownership_kind));
  BindU64(st.get(), 8, r.threshold);
  BindU64(st.get(), 9, r.balance);
  BindU64(st.get(), 10, r.retained_remainder);
  BindU64(st.get(), 11, r.next_request_id);
  BindU64(st.get(), 12, r.likes);
  BindU64(st.get(), 13, r.dislikes);
  BindU64(st.get(), 14, r.created_at_ms);
  BindU64(st.get(), 15, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "page " + std::to_string(r.id));
  }
  if (auto res = Translate(db, rc); !res) return res;

  return WriteOwners(db, r);
}

std::optional<model::PageRecord> SqliteRepository::GetPage(Transaction& t, uint64_t page_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::SELECT_PAGE);
  if (!st) return std::nullopt;

  BindU64(st.get(), 1, page_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::PageRecord r;
  r.id                 = ColU64(st.get(), 0);
  r.name               = ColText(st.get(), 1);
  r.thumbnail          = ColText(st.get(), 2);
  r.content            = ColText(st.get(), 3);
  r.immutable          = ColBool(st.get(), 4);
  r.update_fee         = ColU64(st.get(), 5);
  r.ownership_kind     = sqlite3_column_int(st.get(), 6);
  r.threshold          = static_cast<uint32_t>(ColU64(st.get(), 7));
  r.balance            = ColU64(st.get(), 8);
  r.retained_remainder = ColU64(st.get(), 9);
  r.next_request_id    = ColU64(st.get(), 10);
  r.likes              = ColU64(st.get(), 11);
  r.dislikes           = ColU64(st.get(), 12);
  r.created_at_ms      = ColU64(st.get(), 13);
  r.updated_at_ms      = ColU64(st.get(), 14);

  r.owners = ReadPrincipals(db, sql::SELECT_OWNERS, page_id, std::nullopt);
  return r;
}

Result SqliteRepository::UpdatePage(Transaction& t, const model::PageRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::UPDATE_PAGE);
  if (!st) return PrepareError(db);

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.thumbnail);
  BindText(st.get(), 3, r.content);
  BindBool(st.get(), 4, r.immutable);
  BindU64(st.get(), 5, r.update_fee);
  BindU64(st.get(), 6, static_cast<uint64_t>(r.ownership_kind));
  BindU64(st.get(), 7, r.threshold);
  BindU64(st.get(), 8, r.balance);
  BindU64(st.get(), 9, r.retained_remainder);
  BindU64(st.get(), 10, r.next_request_id);
  BindU64(st.get(), 11, r.likes);
  BindU64(st.get(), 12, r.dislikes);
  BindU64(st.get(), 13, r.created_at_ms);
  BindU64(st.get(), 14, r.updated_at_ms);
  BindU64(st.get(), 15, r.id);

  if (auto res = Translate(db, sqlite3_step(st.get())); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "page " + std::to_string(r.id));

  return WriteOwners(db, r);
}

uint64_t SqliteRepository::CountPages(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::COUNT_PAGES);
  if (!st || sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Update requests
// ------------------------------------------------------------------

Result SqliteRepository::InsertUpdateRequest(Transaction& t, const model::UpdateRequestRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::INSERT_REQUEST);
  if (!st) return PrepareError(db);

  BindU64(st.get(), 1, r.page_id);
  BindU64(st.get(), 2, r.request_id);
  BindText(st.get(), 3, r.proposer);
  BindOptionalText(st.get(), 4, r.content);
  BindOptionalText(st.get(), 5, r.name);
  BindOptionalText(st.get(), 6, r.thumbnail);
  BindBool(st.get(), 7, r.executed);
  BindU64(st.get(), 8, r.approval_count);
  BindU64(st.get(), 9, r.created_at_ms);
  BindU64(st.get(), 10, r.executed_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
    return Result::Err(ErrorCode::AlreadyExists, "update request");
  }
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::NotFound, "page " + std::to_string(r.page_id));
  }
  return Translate(db, rc);
}

std::optional<model::UpdateRequestRecord> SqliteRepository::GetUpdateRequest(Transaction& t, uint64_t page_id, uint64_t request_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::SELECT_REQUEST);
  if (!st) return std::nullopt;

  BindU64(st.get(), 1, page_id);
  BindU64(st.get(), 2, request_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::UpdateRequestRecord r;
  r.page_id        = ColU64(st.get(), 0);
  r.request_id     = ColU64(st.get(), 1);
  r.proposer       = ColText(st.get(), 2);
  r.content        = ColOptionalText(st.get(), 3);
  r.name           = ColOptionalText(st.get(), 4);
  r.thumbnail      = ColOptionalText(st.get(), 5);
  r.executed       = ColBool(st.get(), 6);
  r.approval_count = static_cast<uint32_t>(ColU64(st.get(), 7));
  r.created_at_ms  = ColU64(st.get(), 8);
  r.executed_at_ms = ColU64(st.get(), 9);
  return r;
}

Result SqliteRepository::UpdateUpdateRequest(Transaction& t, const model::UpdateRequestRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::UPDATE_REQUEST);
  if (!st) return PrepareError(db);

  BindText(st.get(), 1, r.proposer);
  BindOptionalText(st.get(), 2, r.content);
  BindOptionalText(st.get(), 3, r.name);
  BindOptionalText(st.get(), 4, r.thumbnail);
  BindBool(st.get(), 5, r.executed);
  BindU64(st.get(), 6, r.approval_count);
  BindU64(st.get(), 7, r.created_at_ms);
  BindU64(st.get(), 8, r.executed_at_ms);
  BindU64(st.get(), 9, r.page_id);
  BindU64(st.get(), 10, r.request_id);

  if (auto res = Translate(db, sqlite3_step(st.get())); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "update request");
  return Result::Ok();
}

Result SqliteRepository::InsertApproval(Transaction& t, uint64_t page_id, uint64_t request_id, const std::string& principal) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::INSERT_APPROVAL);
  if (!st) return PrepareError(db);

  BindU64(st.get(), 1, page_id);
  BindU64(st.get(), 2, request_id);
  BindText(st.get(), 3, principal);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
    return Result::Err(ErrorCode::AlreadyExists, "approval by " + principal);
  }
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::NotFound, "update request");
  }
  return Translate(db, rc);
}

std::vector<std::string> SqliteRepository::ListApprovals(Transaction& t, uint64_t page_id, uint64_t request_id) {
  return ReadPrincipals(TX(t).Handle(), sql::SELECT_APPROVALS, page_id, request_id);
}

// ------------------------------------------------------------------
// Participants
// ------------------------------------------------------------------

Result SqliteRepository::AppendParticipant(Transaction& t, uint64_t page_id, const std::string& principal) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::INSERT_PARTICIPANT);
  if (!st) return PrepareError(db);

  BindU64(st.get(), 1, page_id);
  BindText(st.get(), 2, principal);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE) {
    return Result::Err(ErrorCode::AlreadyExists, "participant " + principal);
  }
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::NotFound, "page " + std::to_string(page_id));
  }
  return Translate(db, rc);
}

std::vector<std::string> SqliteRepository::ListParticipants(Transaction& t, uint64_t page_id) {
  return ReadPrincipals(TX(t).Handle(), sql::SELECT_PARTICIPANTS, page_id, std::nullopt);
}

// ------------------------------------------------------------------
// Reactions
// ------------------------------------------------------------------

Result SqliteRepository::UpsertReaction(Transaction& t, const model::ReactionRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::UPSERT_REACTION);
  if (!st) return PrepareError(db);

  BindU64(st.get(), 1, r.page_id);
  BindText(st.get(), 2, r.principal);
  BindBool(st.get(), 3, r.liked);
  BindBool(st.get(), 4, r.disliked);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::NotFound, "page " + std::to_string(r.page_id));
  }
  return Translate(db, rc);
}

std::optional<model::ReactionRecord> SqliteRepository::GetReaction(Transaction& t, uint64_t page_id, const std::string& principal) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::SELECT_REACTION);
  if (!st) return std::nullopt;

  BindU64(st.get(), 1, page_id);
  BindText(st.get(), 2, principal);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ReactionRecord r;
  r.page_id   = ColU64(st.get(), 0);
  r.principal = ColText(st.get(), 1);
  r.liked     = ColBool(st.get(), 2);
  r.disliked  = ColBool(st.get(), 3);
  return r;
}

} // namespace pagereg::db::sqlite
