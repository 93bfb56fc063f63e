#pragma once

namespace cdn::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Postgres installs $n-parameter equivalents as prepared
  statements in PgPool.
*/

// origins

static constexpr const char* INSERT_ORIGIN =
    "INSERT INTO origins(name,origin_url,cdn_url,provider,status,cache_ttl,notes,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ORIGIN =
    "SELECT id,name,origin_url,cdn_url,provider,status,cache_ttl,notes,created_at_ms,last_purge_ms"
    " FROM origins WHERE id=?;";

static constexpr const char* SELECT_ORIGINS =
    "SELECT id,name,origin_url,cdn_url,provider,status,cache_ttl,notes,created_at_ms,last_purge_ms"
    " FROM origins ORDER BY name;";

static constexpr const char* SELECT_ORIGINS_BY_PROVIDER =
    "SELECT id,name,origin_url,cdn_url,provider,status,cache_ttl,notes,created_at_ms,last_purge_ms"
    " FROM origins WHERE provider=? ORDER BY name;";

static constexpr const char* UPDATE_ORIGIN_LAST_PURGE =
    "UPDATE origins SET last_purge_ms=? WHERE id=?;";

static constexpr const char* UPDATE_ORIGIN_STATUS =
    "UPDATE origins SET status=? WHERE id=?;";

// cache rules

static constexpr const char* INSERT_CACHE_RULE =
    "INSERT INTO cache_rules(origin_id,path_pattern,ttl,cache_headers,rule_type,created_at_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_CACHE_RULES =
    "SELECT id,origin_id,path_pattern,ttl,cache_headers,rule_type,created_at_ms"
    " FROM cache_rules ORDER BY id;";

static constexpr const char* SELECT_CACHE_RULES_BY_ORIGIN =
    "SELECT id,origin_id,path_pattern,ttl,cache_headers,rule_type,created_at_ms"
    " FROM cache_rules WHERE origin_id=? ORDER BY id;";

static constexpr const char* COUNT_CACHE_RULES =
    "SELECT COUNT(*) FROM cache_rules;";

// purge events

static constexpr const char* INSERT_PURGE_EVENT =
    "INSERT INTO purge_events(origin_id,purge_type,target,status,triggered_by,created_at_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_RECENT_PURGE_EVENTS =
    "SELECT id,origin_id,purge_type,target,status,triggered_by,created_at_ms"
    " FROM purge_events ORDER BY created_at_ms DESC, id DESC LIMIT ?;";

static constexpr const char* COUNT_PURGE_EVENTS =
    "SELECT COUNT(*) FROM purge_events;";

static constexpr const char* COUNT_PURGE_EVENTS_SINCE =
    "SELECT COUNT(*) FROM purge_events WHERE created_at_ms > ?;";

// migrations

static constexpr const char* SELECT_SCHEMA_VERSION =
    "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;";

static constexpr const char* INSERT_SCHEMA_VERSION =
    "INSERT INTO schema_migrations(version,applied_at_ms) VALUES(?,?);";

}
