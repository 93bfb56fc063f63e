#include "pg_migrations.hpp"

#include "internal/db/api/result.hpp"

namespace cdn::db::postgres {

PgMigrationExecutor::PgMigrationExecutor(const std::string& conninfo) {
  try {
    conn_ = std::make_unique<pqxx::connection>(conninfo);
  } catch (const pqxx::broken_connection& e) {
    throw DbError(ErrorCode::IOError, e.what());
  }
}

void PgMigrationExecutor::ExecuteSQL(const std::string& sql) {
  if (current_) {
    current_->exec(sql);
    return;
  }

  pqxx::nontransaction tx(*conn_);
  tx.exec(sql);
}

int PgMigrationExecutor::CurrentVersion() {
  pqxx::nontransaction tx(*conn_);
  return tx.query_value<int>("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
}

void PgMigrationExecutor::RecordVersion(int version, uint64_t applied_at_ms) {
  if (!current_) {
    throw DbError(ErrorCode::InternalError, "RecordVersion outside a migration transaction");
  }
  current_->exec_params("INSERT INTO schema_migrations(version, applied_at_ms) VALUES($1, $2);", version,
                        static_cast<int64_t>(applied_at_ms));
}

void PgMigrationExecutor::InTransaction(const std::function<void()>& body) {
  pqxx::work tx(*conn_);
  current_ = &tx;
  try {
    body();
  } catch (const std::exception&) {
    current_ = nullptr;
    throw;
  }
  current_ = nullptr;
  tx.commit();
}

}
