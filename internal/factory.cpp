#include "factory.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/content/content_validator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/treasury/entropy.hpp"
#include "internal/util/errors.hpp"
#if PAGEREG_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace pagereg::factory {

using namespace pagereg;

namespace {

#if PAGEREG_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  db::sql::RunMigrations(*sqlite_db, db::sql::RegistrySchema());

  sqlite_db->Exec("SELECT id,name,thumbnail,content,immutable,update_fee,ownership_kind,threshold,balance,retained_remainder,next_request_id,likes,dislikes,created_at_ms,updated_at_ms FROM pages LIMIT 1;");
  sqlite_db->Exec("SELECT page_id,position,principal FROM page_owners LIMIT 1;");
  sqlite_db->Exec("SELECT page_id,request_id,proposer,content,name,thumbnail,executed,approval_count,created_at_ms,executed_at_ms FROM update_requests LIMIT 1;");
  sqlite_db->Exec("SELECT page_id,request_id,position,principal FROM request_approvals LIMIT 1;");
  sqlite_db->Exec("SELECT page_id,position,principal FROM participants LIMIT 1;");
  sqlite_db->Exec("SELECT page_id,principal,liked,disliked FROM reactions LIMIT 1;");
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const pagereg::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PAGEREG_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    PAGEREG_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, "sqlite backend requested but not enabled at build time");
#endif
  }

  PAGEREG_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const pagereg::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto validator   = std::make_shared<content::MarkerContentValidator>(content::RulesFromConfig(config.content()));
  auto environment = std::make_shared<treasury::SystemEnvironment>();
  auto event_sink  = std::make_shared<events::LoggingEventSink>();

  const std::vector<std::string> rejected(config.treasury().rejected_accounts().begin(), config.treasury().rejected_accounts().end());
  app.ledger = std::make_shared<treasury::AccountLedger>(rejected);

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.registry   = std::make_shared<registry::PageRegistry>(app.repository, validator, app.ledger, environment, event_sink);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry = app.registry;
  ctx.ledger   = app.ledger;

  app.page_service = std::make_shared<service::PageService>(ctx);

  return app;
}

} // namespace pagereg::factory
