#include "pg_tx.hpp"

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace cdn::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  try {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::broken_connection& e) {
    throw DbError(ErrorCode::IOError, e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      CDN_LOG_WARN("postgres abort failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw DbError(ErrorCode::Conflict, e.what());
  } catch (const pqxx::failure& e) {
    throw DbError(ErrorCode::IOError, e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
