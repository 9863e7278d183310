#include "migrations.hpp"

namespace pagereg::db::sql {

const std::vector<std::string>& RegistrySchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS pages ("
      " id INTEGER PRIMARY KEY,"
      " name TEXT NOT NULL,"
      " thumbnail TEXT NOT NULL,"
      " content TEXT NOT NULL,"
      " immutable INTEGER NOT NULL,"
      " update_fee INTEGER NOT NULL,"
      " ownership_kind INTEGER NOT NULL,"
      " threshold INTEGER NOT NULL,"
      " balance INTEGER NOT NULL,"
      " retained_remainder INTEGER NOT NULL,"
      " next_request_id INTEGER NOT NULL,"
      " likes INTEGER NOT NULL,"
      " dislikes INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS page_owners ("
      " page_id INTEGER NOT NULL REFERENCES pages(id),"
      " position INTEGER NOT NULL,"
      " principal TEXT NOT NULL,"
      " PRIMARY KEY (page_id, position));",

      "CREATE TABLE IF NOT EXISTS update_requests ("
      " page_id INTEGER NOT NULL REFERENCES pages(id),"
      " request_id INTEGER NOT NULL,"
      " proposer TEXT NOT NULL,"
      " content TEXT,"
      " name TEXT,"
      " thumbnail TEXT,"
      " executed INTEGER NOT NULL,"
      " approval_count INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " executed_at_ms INTEGER NOT NULL,"
      " PRIMARY KEY (page_id, request_id));",

      "CREATE TABLE IF NOT EXISTS request_approvals ("
      " page_id INTEGER NOT NULL,"
      " request_id INTEGER NOT NULL,"
      " position INTEGER NOT NULL,"
      " principal TEXT NOT NULL,"
      " PRIMARY KEY (page_id, request_id, principal),"
      " FOREIGN KEY (page_id, request_id) REFERENCES update_requests(page_id, request_id));",

      "CREATE TABLE IF NOT EXISTS participants ("
      " page_id INTEGER NOT NULL REFERENCES pages(id),"
      " position INTEGER NOT NULL,"
      " principal TEXT NOT NULL,"
      " PRIMARY KEY (page_id, position),"
      " UNIQUE (page_id, principal));",

      "CREATE TABLE IF NOT EXISTS reactions ("
      " page_id INTEGER NOT NULL REFERENCES pages(id),"
      " principal TEXT NOT NULL,"
      " liked INTEGER NOT NULL,"
      " disliked INTEGER NOT NULL,"
      " PRIMARY KEY (page_id, principal));",

      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",

      "INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace pagereg::db::sql
