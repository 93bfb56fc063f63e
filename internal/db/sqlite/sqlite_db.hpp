#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace cdn::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

struct SqliteOptions {
  bool     wal_mode        = true;
  unsigned busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  Every failure is raised as db::DbError with a translated code.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

// Throws DbError carrying the translated code when rc is not OK/ROW/DONE.
void ThrowIfError(int rc, sqlite3* db, const char* what);

} // namespace cdn::db::sqlite
