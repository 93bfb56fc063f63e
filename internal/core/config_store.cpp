#include "config_store.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cdn::core {

using namespace cdn::manager::v1;
using cdn::observability::IntField;
using cdn::observability::StringField;

namespace {

constexpr uint64_t kPurgeWindowMs = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::hours(24)).count();

[[noreturn]] void ThrowDbError(db::ErrorCode code, const std::string& message) {
  switch (code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
    case db::ErrorCode::Corruption:
      throw util::StorageUnavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  ThrowDbError(result.code, result.message.empty() ? context : context + ": " + result.message);
}

/*
  Runs body inside one transaction and commits it.
  Any exception leaves the transaction uncommitted, which rolls it back.
*/
template <typename Body>
auto InTransaction(db::Repository& repository, const char* operation, Body&& body) {
  try {
    auto tx     = repository.Begin();
    auto result = body(*tx);
    tx->Commit();
    return result;
  } catch (const db::DbError& e) {
    CDN_LOG_ERROR("store operation failed", {StringField("operation", operation), StringField("error", e.what())});
    ThrowDbError(e.Code(), std::string(operation) + ": " + e.what());
  }
}

void RequireNonEmpty(const std::string& value, const char* field) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(field) + " must not be empty");
  }
}

void RequireNonNegative(int64_t value, const char* field) {
  if (value < 0) {
    throw util::InvalidArgument(std::string(field) + " must be >= 0, got " + std::to_string(value));
  }
}

db::model::OriginRecord RequireOrigin(db::Repository& repository, db::Transaction& tx, int64_t origin_id) {
  auto origin = repository.GetOrigin(tx, origin_id);
  if (!origin) {
    throw util::NotFound("origin " + std::to_string(origin_id) + " not found");
  }
  return *origin;
}

Origin ToProto(const db::model::OriginRecord& record) {
  Origin origin;
  origin.set_id(record.id);
  origin.set_name(record.name);
  origin.set_origin_url(record.origin_url);
  origin.set_cdn_url(record.cdn_url);
  origin.set_provider(record.provider);
  origin.set_status(record.status);
  origin.set_cache_ttl(record.cache_ttl);
  origin.set_notes(record.notes);
  *origin.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  if (record.last_purge_ms) {
    *origin.mutable_last_purge() = util::MillisToProto(*record.last_purge_ms);
  }
  return origin;
}

CacheRule ToProto(const db::model::CacheRuleRecord& record) {
  CacheRule rule;
  rule.set_id(record.id);
  rule.set_origin_id(record.origin_id);
  rule.set_path_pattern(record.path_pattern);
  rule.set_ttl(record.ttl);
  rule.set_cache_headers(record.cache_headers);
  rule.set_rule_type(record.rule_type);
  *rule.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return rule;
}

PurgeEvent ToProto(const db::model::PurgeEventRecord& record) {
  PurgeEvent event;
  event.set_id(record.id);
  event.set_origin_id(record.origin_id);
  event.set_purge_type(record.purge_type);
  event.set_target(record.target);
  event.set_status(record.status);
  event.set_triggered_by(record.triggered_by);
  *event.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return event;
}

} // namespace

ConfigStore::ConfigStore(std::shared_ptr<db::Repository> repository, ClockFn clock, StoreOptions options)
    : repository_(std::move(repository)), clock_(std::move(clock)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("ConfigStore requires a repository");
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

// ------------------------------------------------------------------
// Origins
// ------------------------------------------------------------------

Origin ConfigStore::AddOrigin(const OriginSpec& spec) {
  RequireNonEmpty(spec.name, "name");
  RequireNonEmpty(spec.origin_url, "origin_url");
  RequireNonEmpty(spec.cdn_url, "cdn_url");
  RequireNonEmpty(spec.provider, "provider");
  RequireNonNegative(spec.cache_ttl, "cache_ttl");

  db::model::OriginRecord record;
  record.name          = spec.name;
  record.origin_url    = spec.origin_url;
  record.cdn_url       = spec.cdn_url;
  record.provider      = spec.provider;
  record.status        = std::string(model::ToString(model::OriginStatus::kActive));
  record.cache_ttl     = spec.cache_ttl;
  record.notes         = spec.notes;
  record.created_at_ms = util::ToUnixMillis(clock_());

  auto origin = InTransaction(*repository_, "add_origin", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->InsertOrigin(tx, record), "insert origin '" + spec.name + "'");
    return ToProto(record);
  });

  CDN_LOG_INFO("Origin registered", {IntField("id", origin.id()), StringField("name", origin.name()), StringField("provider", origin.provider())});
  return origin;
}

Origin ConfigStore::GetOrigin(int64_t origin_id) {
  return InTransaction(*repository_, "get_origin", [&](db::Transaction& tx) {
    return ToProto(RequireOrigin(*repository_, tx, origin_id));
  });
}

std::vector<Origin> ConfigStore::ListOrigins(const std::optional<std::string>& provider) {
  return InTransaction(*repository_, "list_origins", [&](db::Transaction& tx) {
    std::vector<Origin> out;
    for (const auto& record : repository_->ListOrigins(tx, provider)) {
      out.push_back(ToProto(record));
    }
    return out;
  });
}

Origin ConfigStore::SetOriginStatus(int64_t origin_id, model::OriginStatus status) {
  const std::string target(model::ToString(status));

  auto origin = InTransaction(*repository_, "set_origin_status", [&](db::Transaction& tx) {
    auto record  = RequireOrigin(*repository_, tx, origin_id);
    auto current = model::ParseOriginStatus(record.status);
    if (current && !model::CanTransition(*current, status)) {
      throw util::InvalidState("origin " + std::to_string(origin_id) + " is already " + record.status);
    }

    ThrowIfDbError(repository_->UpdateOriginStatus(tx, origin_id, target), "update origin status");
    record.status = target;
    return ToProto(record);
  });

  CDN_LOG_INFO("Origin status changed", {IntField("id", origin_id), StringField("status", target)});
  return origin;
}

// ------------------------------------------------------------------
// Cache rules
// ------------------------------------------------------------------

CacheRule ConfigStore::AddCacheRule(const CacheRuleSpec& spec) {
  RequireNonEmpty(spec.path_pattern, "path_pattern");
  RequireNonNegative(spec.ttl, "ttl");

  db::model::CacheRuleRecord record;
  record.origin_id     = spec.origin_id;
  record.path_pattern  = spec.path_pattern;
  record.ttl           = spec.ttl;
  record.cache_headers = spec.cache_headers;
  record.rule_type     = std::string(model::ToString(spec.rule_type));
  record.created_at_ms = util::ToUnixMillis(clock_());

  auto rule = InTransaction(*repository_, "add_cache_rule", [&](db::Transaction& tx) {
    RequireOrigin(*repository_, tx, spec.origin_id);
    ThrowIfDbError(repository_->InsertCacheRule(tx, record), "insert cache rule");
    return ToProto(record);
  });

  CDN_LOG_INFO("Cache rule added",
               {IntField("id", rule.id()), IntField("origin_id", rule.origin_id()), StringField("path_pattern", rule.path_pattern())});
  return rule;
}

std::vector<CacheRule> ConfigStore::ListCacheRules(std::optional<int64_t> origin_id) {
  return InTransaction(*repository_, "list_cache_rules", [&](db::Transaction& tx) {
    if (origin_id) {
      RequireOrigin(*repository_, tx, *origin_id);
    }

    std::vector<CacheRule> out;
    for (const auto& record : repository_->ListCacheRules(tx, origin_id)) {
      out.push_back(ToProto(record));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Purges
// ------------------------------------------------------------------

PurgeEvent ConfigStore::PurgeCache(const PurgeSpec& spec) {
  db::model::PurgeEventRecord record;
  record.origin_id     = spec.origin_id;
  record.purge_type    = std::string(model::ToString(spec.purge_type));
  record.target        = spec.target;
  record.status        = std::string(model::ToString(model::PurgeStatus::kQueued));
  record.triggered_by  = spec.triggered_by;
  record.created_at_ms = util::ToUnixMillis(clock_());

  // event row and last_purge stamp commit together or not at all
  auto event = InTransaction(*repository_, "purge_cache", [&](db::Transaction& tx) {
    RequireOrigin(*repository_, tx, spec.origin_id);
    ThrowIfDbError(repository_->InsertPurgeEvent(tx, record), "insert purge event");
    ThrowIfDbError(repository_->UpdateOriginLastPurge(tx, spec.origin_id, record.created_at_ms), "stamp last_purge");
    return ToProto(record);
  });

  CDN_LOG_INFO("Purge queued", {IntField("event_id", event.id()), IntField("origin_id", event.origin_id()),
                                StringField("purge_type", event.purge_type()), StringField("target", event.target())});
  return event;
}

// ------------------------------------------------------------------
// Derived views
// ------------------------------------------------------------------

StatusSummary ConfigStore::CdnStatus() {
  const uint64_t now_ms = util::ToUnixMillis(clock_());
  const uint64_t since  = now_ms > kPurgeWindowMs ? now_ms - kPurgeWindowMs : 0;

  return InTransaction(*repository_, "cdn_status", [&](db::Transaction& tx) {
    StatusSummary summary;

    const auto origins = repository_->ListOrigins(tx, std::nullopt);
    summary.set_total_origins(origins.size());
    summary.set_total_rules(repository_->CountCacheRules(tx));
    summary.set_total_purges(repository_->CountPurgeEvents(tx, std::nullopt));
    summary.set_purges_24h(repository_->CountPurgeEvents(tx, since));

    auto& by_provider = *summary.mutable_by_provider();
    auto& by_status   = *summary.mutable_by_status();
    for (const auto& origin : origins) {
      ++by_provider[origin.provider];
      ++by_status[origin.status];
    }
    return summary;
  });
}

ExportDocument ConfigStore::ExportAll() {
  const auto exported_at = clock_();

  return InTransaction(*repository_, "export_all", [&](db::Transaction& tx) {
    ExportDocument doc;
    *doc.mutable_exported_at() = util::ToProto(exported_at);

    for (const auto& record : repository_->ListOrigins(tx, std::nullopt)) {
      *doc.add_origins() = ToProto(record);
    }
    for (const auto& record : repository_->ListCacheRules(tx, std::nullopt)) {
      *doc.add_cache_rules() = ToProto(record);
    }
    for (const auto& record : repository_->ListRecentPurgeEvents(tx, options_.recent_purge_limit)) {
      *doc.add_recent_purge_events() = ToProto(record);
    }
    return doc;
  });
}

} // namespace cdn::core
