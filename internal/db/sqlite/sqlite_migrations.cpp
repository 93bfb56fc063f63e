#include "sqlite_migrations.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "sqlite_tx.hpp"

namespace cdn::db::sqlite {

SqliteMigrationExecutor::SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteMigrationExecutor::ExecuteSQL(const std::string& sql) {
  db_->Exec(sql);
}

int SqliteMigrationExecutor::CurrentVersion() {
  auto st = db_->Prepare(sql::SELECT_SCHEMA_VERSION);
  int  rc = sqlite3_step(st.get());
  ThrowIfError(rc, db_->Handle(), "read schema version");
  return rc == SQLITE_ROW ? sqlite3_column_int(st.get(), 0) : 0;
}

void SqliteMigrationExecutor::RecordVersion(int version, uint64_t applied_at_ms) {
  auto st = db_->Prepare(sql::INSERT_SCHEMA_VERSION);
  sqlite3_bind_int(st.get(), 1, version);
  sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(applied_at_ms));
  ThrowIfError(sqlite3_step(st.get()), db_->Handle(), "record schema version");
}

void SqliteMigrationExecutor::InTransaction(const std::function<void()>& body) {
  SqliteTransaction tx(db_);
  body();
  tx.Commit();
}

}
