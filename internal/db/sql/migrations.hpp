#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace cdn::db::sql {

/*
  Versioned schema migration.

  Applied in ascending version order, each inside its own
  transaction, and recorded in schema_migrations.
*/

struct Migration {
  int                      version = 0;
  std::string              description;
  std::vector<std::string> statements;
};

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and the version bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest recorded version, 0 for an empty store.
  virtual int CurrentVersion() = 0;

  virtual void RecordVersion(int version, uint64_t applied_at_ms) = 0;

  // Runs body atomically; throws if body throws.
  virtual void InTransaction(const std::function<void()>& body) = 0;
};

// Returns the number of migrations applied.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

const std::vector<Migration>& SqliteMigrations();
const std::vector<Migration>& PostgresMigrations();

} // namespace cdn::db::sql
