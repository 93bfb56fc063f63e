#include "pg_pool.hpp"

namespace cdn::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_origin",
               "INSERT INTO origins(name,origin_url,cdn_url,provider,status,cache_ttl,notes,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id");

  conn.prepare("get_origin",
               "SELECT id,name,origin_url,cdn_url,provider,status,cache_ttl,notes,created_at_ms,last_purge_ms "
               "FROM origins WHERE id=$1");

  conn.prepare("list_origins",
               "SELECT id,name,origin_url,cdn_url,provider,status,cache_ttl,notes,created_at_ms,last_purge_ms "
               "FROM origins ORDER BY name COLLATE \"C\"");

  conn.prepare("list_origins_by_provider",
               "SELECT id,name,origin_url,cdn_url,provider,status,cache_ttl,notes,created_at_ms,last_purge_ms "
               "FROM origins WHERE provider=$1 ORDER BY name COLLATE \"C\"");

  conn.prepare("update_origin_last_purge", "UPDATE origins SET last_purge_ms=$2 WHERE id=$1");

  conn.prepare("update_origin_status", "UPDATE origins SET status=$2 WHERE id=$1");

  conn.prepare("insert_cache_rule",
               "INSERT INTO cache_rules(origin_id,path_pattern,ttl,cache_headers,rule_type,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6) RETURNING id");

  conn.prepare("list_cache_rules",
               "SELECT id,origin_id,path_pattern,ttl,cache_headers,rule_type,created_at_ms FROM cache_rules ORDER BY id");

  conn.prepare("list_cache_rules_by_origin",
               "SELECT id,origin_id,path_pattern,ttl,cache_headers,rule_type,created_at_ms FROM cache_rules "
               "WHERE origin_id=$1 ORDER BY id");

  conn.prepare("insert_purge_event",
               "INSERT INTO purge_events(origin_id,purge_type,target,status,triggered_by,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6) RETURNING id");

  conn.prepare("list_recent_purge_events",
               "SELECT id,origin_id,purge_type,target,status,triggered_by,created_at_ms FROM purge_events "
               "ORDER BY created_at_ms DESC, id DESC LIMIT $1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace cdn::db::postgres
