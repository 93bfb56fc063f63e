#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/sql/migrations.hpp"

namespace cdn::db::postgres {

/*
  Runs migrations over a dedicated connection; pooled connections
  prepare statements against tables that may not exist yet.
  Statements outside InTransaction() execute in autocommit mode.
*/
class PgMigrationExecutor final : public sql::MigrationExecutor {
public:
  explicit PgMigrationExecutor(const std::string& conninfo);

  void ExecuteSQL(const std::string& sql) override;
  int CurrentVersion() override;
  void RecordVersion(int version, uint64_t applied_at_ms) override;
  void InTransaction(const std::function<void()>& body) override;

private:
  std::unique_ptr<pqxx::connection> conn_;
  pqxx::work* current_ = nullptr;
};

}
