#pragma once

#include <memory>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_db.hpp"

namespace cdn::db::sqlite {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
public:
  explicit SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db);

  void ExecuteSQL(const std::string& sql) override;
  int CurrentVersion() override;
  void RecordVersion(int version, uint64_t applied_at_ms) override;
  void InTransaction(const std::function<void()>& body) override;

private:
  std::shared_ptr<SqliteDB> db_;
};

}
