#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "internal/db/api/result.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if CDN_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CDN_DB_POSTGRES
#include "internal/db/postgres/pg_migrations.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace cdn::factory {

using cdn::observability::IntField;
using cdn::observability::StringField;

namespace {

#if CDN_DB_SQLITE
void EnsureParentDirectory(const std::string& path) {
  if (path.empty() || path == ":memory:") {
    return;
  }

  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw util::StorageUnavailable("cannot create directory " + parent.string() + ": " + ec.message());
  }
}
#endif

#if CDN_DB_POSTGRES
std::shared_ptr<db::Repository> OpenPostgresRepository(const cdn::runtime::config::PostgresConfig& config) {
  try {
    {
      db::postgres::PgMigrationExecutor executor(config.connection_uri());
      db::sql::RunMigrations(executor, db::sql::PostgresMigrations());
    }

    auto pool = std::make_shared<db::postgres::PgPool>(config.connection_uri(), config.max_connections());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
  } catch (const db::DbError& e) {
    throw util::StorageUnavailable("cannot open postgres store: " + std::string(e.what()));
  } catch (const pqxx::failure& e) {
    throw util::StorageUnavailable("cannot open postgres store: " + std::string(e.what()));
  }
}
#endif

} // namespace

#if CDN_DB_SQLITE
std::shared_ptr<db::Repository> OpenSqliteRepository(const std::string& path, bool wal_mode, unsigned busy_timeout_ms) {
  EnsureParentDirectory(path);

  try {
    db::sqlite::SqliteOptions options;
    options.wal_mode        = wal_mode;
    options.busy_timeout_ms = busy_timeout_ms;

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, options);

    db::sqlite::SqliteMigrationExecutor executor(sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteMigrations());

    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  } catch (const db::DbError& e) {
    throw util::StorageUnavailable("cannot open store " + path + ": " + e.what());
  }
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const cdn::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
#if CDN_DB_SQLITE
    const auto& sqlite = database.sqlite();
    CDN_LOG_INFO("Opening sqlite store", {StringField("path", sqlite.path())});
    return OpenSqliteRepository(sqlite.path(), sqlite.wal_mode(), sqlite.busy_timeout_ms());
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CDN_DB_POSTGRES
    CDN_LOG_INFO("Opening postgres store", {IntField("max_connections", database.postgres().max_connections())});
    return OpenPostgresRepository(database.postgres());
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CDN_LOG_INFO("Using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const cdn::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config);

  core::StoreOptions options;
  if (config.export_().recent_purge_limit() > 0) {
    options.recent_purge_limit = config.export_().recent_purge_limit();
  }

  app.store = std::make_shared<core::ConfigStore>(app.repository, util::Now, options);
  return app;
}

} // namespace cdn::factory
