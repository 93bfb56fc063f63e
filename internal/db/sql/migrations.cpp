#include "migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace cdn::db::sql {

namespace {

constexpr const char* kCreateMigrationsTable =
    "CREATE TABLE IF NOT EXISTS schema_migrations ("
    " version INTEGER PRIMARY KEY,"
    " applied_at_ms BIGINT NOT NULL);";

} // namespace

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  executor.ExecuteSQL(kCreateMigrationsTable);

  const int current = executor.CurrentVersion();
  int       applied = 0;

  for (const auto& migration : ordered) {
    if (migration.version <= current) continue;

    executor.InTransaction([&] {
      for (const auto& statement : migration.statements) {
        executor.ExecuteSQL(statement);
      }
      executor.RecordVersion(migration.version, util::ToUnixMillis(util::Now()));
    });

    CDN_LOG_INFO("Applied schema migration", {observability::IntField("version", migration.version),
                                              observability::StringField("description", migration.description)});
    ++applied;
  }

  return applied;
}

const std::vector<Migration>& SqliteMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "initial schema",
       {"CREATE TABLE IF NOT EXISTS origins ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " name TEXT NOT NULL UNIQUE,"
        " origin_url TEXT NOT NULL,"
        " cdn_url TEXT NOT NULL,"
        " provider TEXT NOT NULL DEFAULT 'cloudflare',"
        " status TEXT NOT NULL DEFAULT 'active',"
        " cache_ttl INTEGER NOT NULL DEFAULT 3600,"
        " notes TEXT NOT NULL DEFAULT '',"
        " created_at_ms INTEGER NOT NULL DEFAULT (CAST(strftime('%s','now') AS INTEGER) * 1000),"
        " last_purge_ms INTEGER);",

        "CREATE TABLE IF NOT EXISTS cache_rules ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " origin_id INTEGER NOT NULL REFERENCES origins(id) ON DELETE CASCADE,"
        " path_pattern TEXT NOT NULL,"
        " ttl INTEGER NOT NULL DEFAULT 3600,"
        " cache_headers INTEGER NOT NULL DEFAULT 1,"
        " rule_type TEXT NOT NULL DEFAULT 'cache',"
        " created_at_ms INTEGER NOT NULL DEFAULT (CAST(strftime('%s','now') AS INTEGER) * 1000));",

        "CREATE TABLE IF NOT EXISTS purge_events ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " origin_id INTEGER NOT NULL REFERENCES origins(id),"
        " purge_type TEXT NOT NULL DEFAULT 'full',"
        " target TEXT NOT NULL DEFAULT '*',"
        " status TEXT NOT NULL DEFAULT 'queued',"
        " triggered_by TEXT NOT NULL DEFAULT 'cli',"
        " created_at_ms INTEGER NOT NULL DEFAULT (CAST(strftime('%s','now') AS INTEGER) * 1000));"}},
      {2,
       "lookup indexes",
       {"CREATE INDEX IF NOT EXISTS idx_origins_provider ON origins(provider);",
        "CREATE INDEX IF NOT EXISTS idx_cache_rules_origin ON cache_rules(origin_id);",
        "CREATE INDEX IF NOT EXISTS idx_purge_events_created ON purge_events(created_at_ms);"}},
  };
  return kMigrations;
}

const std::vector<Migration>& PostgresMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "initial schema",
       {"CREATE TABLE IF NOT EXISTS origins ("
        " id BIGSERIAL PRIMARY KEY,"
        " name TEXT NOT NULL UNIQUE,"
        " origin_url TEXT NOT NULL,"
        " cdn_url TEXT NOT NULL,"
        " provider TEXT NOT NULL DEFAULT 'cloudflare',"
        " status TEXT NOT NULL DEFAULT 'active',"
        " cache_ttl BIGINT NOT NULL DEFAULT 3600,"
        " notes TEXT NOT NULL DEFAULT '',"
        " created_at_ms BIGINT NOT NULL DEFAULT CAST(extract(epoch FROM now()) * 1000 AS BIGINT),"
        " last_purge_ms BIGINT);",

        "CREATE TABLE IF NOT EXISTS cache_rules ("
        " id BIGSERIAL PRIMARY KEY,"
        " origin_id BIGINT NOT NULL REFERENCES origins(id) ON DELETE CASCADE,"
        " path_pattern TEXT NOT NULL,"
        " ttl BIGINT NOT NULL DEFAULT 3600,"
        " cache_headers BOOLEAN NOT NULL DEFAULT TRUE,"
        " rule_type TEXT NOT NULL DEFAULT 'cache',"
        " created_at_ms BIGINT NOT NULL DEFAULT CAST(extract(epoch FROM now()) * 1000 AS BIGINT));",

        "CREATE TABLE IF NOT EXISTS purge_events ("
        " id BIGSERIAL PRIMARY KEY,"
        " origin_id BIGINT NOT NULL REFERENCES origins(id),"
        " purge_type TEXT NOT NULL DEFAULT 'full',"
        " target TEXT NOT NULL DEFAULT '*',"
        " status TEXT NOT NULL DEFAULT 'queued',"
        " triggered_by TEXT NOT NULL DEFAULT 'cli',"
        " created_at_ms BIGINT NOT NULL DEFAULT CAST(extract(epoch FROM now()) * 1000 AS BIGINT));"}},
      {2,
       "lookup indexes",
       {"CREATE INDEX IF NOT EXISTS idx_origins_provider ON origins(provider);",
        "CREATE INDEX IF NOT EXISTS idx_cache_rules_origin ON cache_rules(origin_id);",
        "CREATE INDEX IF NOT EXISTS idx_purge_events_created ON purge_events(created_at_ms);"}},
  };
  return kMigrations;
}

} // namespace cdn::db::sql
