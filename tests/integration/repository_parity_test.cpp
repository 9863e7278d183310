#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if PAGEREG_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using pagereg::db::ErrorCode;
using pagereg::db::Repository;
using pagereg::db::memory::MemoryRepository;
using pagereg::db::model::PageRecord;
using pagereg::db::model::ReactionRecord;
using pagereg::db::model::UpdateRequestRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

PageRecord MakePage(uint64_t id) {
  PageRecord page;
  page.id             = id;
  page.name           = "page-" + std::to_string(id);
  page.thumbnail      = "ipfs://thumb-" + std::to_string(id);
  page.content        = "<html>" + std::to_string(id) + "</html>";
  page.update_fee     = 10;
  page.ownership_kind = 2;
  page.owners         = {"carol", "alice", "bob"};
  page.threshold      = 2;
  page.created_at_ms  = NowMs();
  page.updated_at_ms  = page.created_at_ms;
  return page;
}

void VerifyPageReadWrite(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.CountPages(*tx) == 0);

  auto page = MakePage(1);
  assert(repo.InsertPage(*tx, page));
  assert(repo.InsertPage(*tx, page).code == ErrorCode::AlreadyExists);
  assert(repo.InsertPage(*tx, MakePage(2)));
  assert(repo.CountPages(*tx) == 2);

  auto read = repo.GetPage(*tx, 1);
  assert(read.has_value());
  assert(read->name == "page-1");
  assert(read->owners == std::vector<std::string>({"carol", "alice", "bob"}));
  assert(read->threshold == 2);
  assert(!read->immutable);

  read->balance            = 1001;
  read->retained_remainder = 2;
  read->next_request_id    = 3;
  read->likes              = 4;
  read->owners             = {"dave"};
  assert(repo.UpdatePage(*tx, *read));

  auto updated = repo.GetPage(*tx, 1);
  assert(updated.has_value());
  assert(updated->balance == 1001);
  assert(updated->retained_remainder == 2);
  assert(updated->next_request_id == 3);
  assert(updated->likes == 4);
  assert(updated->owners == std::vector<std::string>({"dave"}));

  assert(!repo.GetPage(*tx, 99).has_value());
  assert(repo.UpdatePage(*tx, MakePage(99)).code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyUpdateRequests(Repository& repo) {
  auto tx = repo.Begin();

  UpdateRequestRecord request;
  request.page_id       = 1;
  request.request_id    = 0;
  request.proposer      = "payer";
  request.content       = "<html>next</html>";
  request.created_at_ms = NowMs();
  assert(repo.InsertUpdateRequest(*tx, request));
  assert(repo.InsertUpdateRequest(*tx, request).code == ErrorCode::AlreadyExists);

  UpdateRequestRecord orphan = request;
  orphan.page_id             = 99;
  assert(repo.InsertUpdateRequest(*tx, orphan).code == ErrorCode::NotFound);

  auto read = repo.GetUpdateRequest(*tx, 1, 0);
  assert(read.has_value());
  assert(read->proposer == "payer");
  assert(read->content.has_value() && *read->content == "<html>next</html>");
  assert(!read->name.has_value());
  assert(!read->thumbnail.has_value());
  assert(!read->executed);

  assert(repo.InsertApproval(*tx, 1, 0, "carol"));
  assert(repo.InsertApproval(*tx, 1, 0, "alice"));
  assert(repo.InsertApproval(*tx, 1, 0, "carol").code == ErrorCode::AlreadyExists);
  assert(repo.InsertApproval(*tx, 1, 7, "carol").code == ErrorCode::NotFound);
  assert(repo.ListApprovals(*tx, 1, 0) == std::vector<std::string>({"carol", "alice"}));

  read->executed       = true;
  read->approval_count = 2;
  read->executed_at_ms = NowMs();
  assert(repo.UpdateUpdateRequest(*tx, *read));

  auto executed = repo.GetUpdateRequest(*tx, 1, 0);
  assert(executed.has_value());
  assert(executed->executed);
  assert(executed->approval_count == 2);
  assert(!repo.GetUpdateRequest(*tx, 1, 1).has_value());

  tx->Commit();
}

void VerifyParticipantsAndReactions(Repository& repo) {
  auto tx = repo.Begin();

  assert(repo.ListParticipants(*tx, 2).empty());
  assert(repo.AppendParticipant(*tx, 2, "zed"));
  assert(repo.AppendParticipant(*tx, 2, "amy"));
  assert(repo.AppendParticipant(*tx, 2, "zed").code == ErrorCode::AlreadyExists);
  assert(repo.AppendParticipant(*tx, 99, "zed").code == ErrorCode::NotFound);
  assert(repo.ListParticipants(*tx, 2) == std::vector<std::string>({"zed", "amy"}));
  assert(repo.ListParticipants(*tx, 1).empty());

  assert(!repo.GetReaction(*tx, 2, "fan").has_value());
  assert(repo.UpsertReaction(*tx, ReactionRecord{.page_id = 2, .principal = "fan", .liked = true, .disliked = false}));
  assert(repo.UpsertReaction(*tx, ReactionRecord{.page_id = 2, .principal = "fan", .liked = false, .disliked = true}));

  auto reaction = repo.GetReaction(*tx, 2, "fan");
  assert(reaction.has_value());
  assert(!reaction->liked);
  assert(reaction->disliked);

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertPage(*tx, MakePage(50)));
    tx->Rollback();
  }

  {
    // Dropped without Commit().
    auto tx = repo.Begin();
    assert(repo.InsertPage(*tx, MakePage(51)));
    assert(repo.AppendParticipant(*tx, 2, "ghost"));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetPage(*check_tx, 50).has_value());
  assert(!repo.GetPage(*check_tx, 51).has_value());
  assert(repo.ListParticipants(*check_tx, 2).size() == 2);
  assert(repo.CountPages(*check_tx) == 2);
  check_tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, bool supports_parallel_transactions) {
  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  auto p1 = repo.GetPage(*tx1, 1);
  auto p2 = repo.GetPage(*tx2, 1);
  assert(p1.has_value() && p2.has_value());

  p1->balance = p1->balance + 5;
  p2->balance = p2->balance + 7;

  assert(repo.UpdatePage(*tx1, *p1));
  tx1->Commit();

  assert(repo.UpdatePage(*tx2, *p2));
  bool conflict = false;
  try {
    tx2->Commit();
  } catch (const std::runtime_error&) {
    conflict = true;
  }
  assert(conflict);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetPage(*verify_tx, 1);
  assert(final.has_value());
  assert(final->balance == 1006);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx   = repo->Begin();
    auto page = MakePage(1);
    page.balance = 77;
    assert(repo->InsertPage(*tx, page));

    UpdateRequestRecord request;
    request.page_id    = 1;
    request.request_id = 0;
    request.proposer   = "payer";
    request.name       = "renamed";
    assert(repo->InsertUpdateRequest(*tx, request));
    assert(repo->InsertApproval(*tx, 1, 0, "alice"));
    assert(repo->AppendParticipant(*tx, 1, "payer"));
    assert(repo->UpsertReaction(*tx, ReactionRecord{.page_id = 1, .principal = "fan", .liked = true, .disliked = false}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto page = repo->GetPage(*tx, 1);
  assert(page.has_value());
  assert(page->balance == 77);
  assert(page->owners == std::vector<std::string>({"carol", "alice", "bob"}));

  auto request = repo->GetUpdateRequest(*tx, 1, 0);
  assert(request.has_value());
  assert(request->name.has_value() && *request->name == "renamed");
  assert(!request->content.has_value());
  assert(repo->ListApprovals(*tx, 1, 0) == std::vector<std::string>({"alice"}));
  assert(repo->ListParticipants(*tx, 1) == std::vector<std::string>({"payer"}));

  auto reaction = repo->GetReaction(*tx, 1, "fan");
  assert(reaction.has_value() && reaction->liked);
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if PAGEREG_DB_SQLITE
BackendFactory MakeSqliteFactory(const std::string& suffix) {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("pagereg_integration_sqlite_" + suffix + "_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<pagereg::db::sqlite::SqliteDB>(db_path);
    pagereg::db::sql::RunMigrations(*db, pagereg::db::sql::RegistrySchema());
    return std::make_shared<pagereg::db::sqlite::SqliteRepository>(db);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory backend) {
  auto repo = backend.make_repository();
  VerifyPageReadWrite(*repo);
  VerifyUpdateRequests(*repo);
  VerifyParticipantsAndReactions(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyConcurrentUpdates(*repo, backend.supports_parallel_transactions);
  repo.reset();
  backend.cleanup();

  VerifyRestartDurability(backend);
  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunBackendSuite(MakeMemoryFactory());
#if PAGEREG_DB_SQLITE
  RunBackendSuite(MakeSqliteFactory("suite"));
#endif

  std::cout << "pagereg_integration_repository_parity: pass\n";
  return 0;
}
