#include "pg_repository.hpp"

namespace cdn::db::postgres {

namespace {

model::OriginRecord ReadOrigin(const pqxx::row& row) {
  model::OriginRecord r;
  r.id            = row[0].as<int64_t>();
  r.name          = row[1].c_str();
  r.origin_url    = row[2].c_str();
  r.cdn_url       = row[3].c_str();
  r.provider      = row[4].c_str();
  r.status        = row[5].c_str();
  r.cache_ttl     = row[6].as<int64_t>();
  r.notes         = row[7].is_null() ? "" : row[7].c_str();
  r.created_at_ms = static_cast<uint64_t>(row[8].as<int64_t>());
  if (!row[9].is_null()) r.last_purge_ms = static_cast<uint64_t>(row[9].as<int64_t>());
  return r;
}

model::CacheRuleRecord ReadCacheRule(const pqxx::row& row) {
  model::CacheRuleRecord r;
  r.id            = row[0].as<int64_t>();
  r.origin_id     = row[1].as<int64_t>();
  r.path_pattern  = row[2].c_str();
  r.ttl           = row[3].as<int64_t>();
  r.cache_headers = row[4].as<bool>();
  r.rule_type     = row[5].c_str();
  r.created_at_ms = static_cast<uint64_t>(row[6].as<int64_t>());
  return r;
}

model::PurgeEventRecord ReadPurgeEvent(const pqxx::row& row) {
  model::PurgeEventRecord r;
  r.id            = row[0].as<int64_t>();
  r.origin_id     = row[1].as<int64_t>();
  r.purge_type    = row[2].c_str();
  r.target        = row[3].c_str();
  r.status        = row[4].c_str();
  r.triggered_by  = row[5].c_str();
  r.created_at_ms = static_cast<uint64_t>(row[6].as<int64_t>());
  return r;
}

// Reads surface driver failures as DbError.
template <typename Fn>
auto GuardRead(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::broken_connection& e) {
    throw DbError(ErrorCode::IOError, e.what());
  } catch (const pqxx::sql_error& e) {
    throw DbError(ErrorCode::InternalError, e.what());
  }
}

Result MissingOrigin(int64_t id) {
  return Result::Err(ErrorCode::NotFound, "origin " + std::to_string(id) + " not found");
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Origins
// ------------------------------------------------------------------

Result PgRepository::InsertOrigin(Transaction& t, model::OriginRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_origin", r.name, r.origin_url, r.cdn_url, r.provider, r.status, r.cache_ttl, r.notes,
                                          static_cast<int64_t>(r.created_at_ms));
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::OriginRecord> PgRepository::GetOrigin(Transaction& t, int64_t id) {
  return GuardRead([&]() -> std::optional<model::OriginRecord> {
    auto res = TX(t).Work().exec_prepared("get_origin", id);
    if (res.empty()) return std::nullopt;
    return ReadOrigin(res[0]);
  });
}

std::vector<model::OriginRecord> PgRepository::ListOrigins(Transaction& t, const std::optional<std::string>& provider) {
  return GuardRead([&] {
    auto res = provider ? TX(t).Work().exec_prepared("list_origins_by_provider", *provider) : TX(t).Work().exec_prepared("list_origins");

    std::vector<model::OriginRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadOrigin(row));
    return out;
  });
}

Result PgRepository::UpdateOriginLastPurge(Transaction& t, int64_t id, uint64_t last_purge_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("update_origin_last_purge", id, static_cast<int64_t>(last_purge_ms));
    if (res.affected_rows() == 0) return MissingOrigin(id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateOriginStatus(Transaction& t, int64_t id, const std::string& status) {
  try {
    auto res = TX(t).Work().exec_prepared("update_origin_status", id, status);
    if (res.affected_rows() == 0) return MissingOrigin(id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Cache rules
// ------------------------------------------------------------------

Result PgRepository::InsertCacheRule(Transaction& t, model::CacheRuleRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_cache_rule", r.origin_id, r.path_pattern, r.ttl, r.cache_headers, r.rule_type,
                                          static_cast<int64_t>(r.created_at_ms));
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CacheRuleRecord> PgRepository::ListCacheRules(Transaction& t, std::optional<int64_t> origin_id) {
  return GuardRead([&] {
    auto res = origin_id ? TX(t).Work().exec_prepared("list_cache_rules_by_origin", *origin_id) : TX(t).Work().exec_prepared("list_cache_rules");

    std::vector<model::CacheRuleRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadCacheRule(row));
    return out;
  });
}

uint64_t PgRepository::CountCacheRules(Transaction& t) {
  return GuardRead([&] {
    auto res = TX(t).Work().exec("SELECT COUNT(*) FROM cache_rules;");
    return static_cast<uint64_t>(res[0][0].as<int64_t>());
  });
}

// ------------------------------------------------------------------
// Purge events
// ------------------------------------------------------------------

Result PgRepository::InsertPurgeEvent(Transaction& t, model::PurgeEventRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_purge_event", r.origin_id, r.purge_type, r.target, r.status, r.triggered_by,
                                          static_cast<int64_t>(r.created_at_ms));
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PurgeEventRecord> PgRepository::ListRecentPurgeEvents(Transaction& t, uint64_t limit) {
  return GuardRead([&] {
    auto res = TX(t).Work().exec_prepared("list_recent_purge_events", static_cast<int64_t>(limit));

    std::vector<model::PurgeEventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadPurgeEvent(row));
    return out;
  });
}

uint64_t PgRepository::CountPurgeEvents(Transaction& t, std::optional<uint64_t> created_after_ms) {
  return GuardRead([&] {
    auto res = created_after_ms
                   ? TX(t).Work().exec_params("SELECT COUNT(*) FROM purge_events WHERE created_at_ms > $1;", static_cast<int64_t>(*created_after_ms))
                   : TX(t).Work().exec("SELECT COUNT(*) FROM purge_events;");
    return static_cast<uint64_t>(res[0][0].as<int64_t>());
  });
}

} // namespace cdn::db::postgres
