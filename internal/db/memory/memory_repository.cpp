#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace cdn::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static Result MissingOrigin(int64_t id) {
  return Result::Err(ErrorCode::NotFound, "origin " + std::to_string(id) + " not found");
}

// ------------------------------------------------------------------
// Origins
// ------------------------------------------------------------------

Result MemoryRepository::InsertOrigin(Transaction& t, model::OriginRecord& r) {
  auto& s = TX(t).Mutable();
  const bool taken = std::any_of(s.origins.begin(), s.origins.end(), [&](const auto& entry) { return entry.second.name == r.name; });
  if (taken) return Result::Err(ErrorCode::AlreadyExists, "origin name '" + r.name + "' already exists");

  r.id             = s.next_origin_id++;
  s.origins[r.id]  = r;
  return Result::Ok();
}

std::optional<model::OriginRecord> MemoryRepository::GetOrigin(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.origins.find(id);
  if (it == s.origins.end()) return std::nullopt;
  return it->second;
}

std::vector<model::OriginRecord> MemoryRepository::ListOrigins(Transaction& t, const std::optional<std::string>& provider) {
  const auto&                      s = TX(t).View();
  std::vector<model::OriginRecord> out;
  for (const auto& [_, record] : s.origins) {
    if (provider && record.provider != *provider) continue;
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
  return out;
}

Result MemoryRepository::UpdateOriginLastPurge(Transaction& t, int64_t id, uint64_t last_purge_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.origins.find(id);
  if (it == s.origins.end()) return MissingOrigin(id);
  it->second.last_purge_ms = last_purge_ms;
  return Result::Ok();
}

Result MemoryRepository::UpdateOriginStatus(Transaction& t, int64_t id, const std::string& status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.origins.find(id);
  if (it == s.origins.end()) return MissingOrigin(id);
  it->second.status = status;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Cache rules
// ------------------------------------------------------------------

Result MemoryRepository::InsertCacheRule(Transaction& t, model::CacheRuleRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.origins.contains(r.origin_id)) return MissingOrigin(r.origin_id);

  r.id                = s.next_rule_id++;
  s.cache_rules[r.id] = r;
  return Result::Ok();
}

std::vector<model::CacheRuleRecord> MemoryRepository::ListCacheRules(Transaction& t, std::optional<int64_t> origin_id) {
  std::vector<model::CacheRuleRecord> out;
  for (const auto& [_, rule] : TX(t).View().cache_rules) {
    if (origin_id && rule.origin_id != *origin_id) continue;
    out.push_back(rule);
  }
  return out;
}

uint64_t MemoryRepository::CountCacheRules(Transaction& t) {
  return TX(t).View().cache_rules.size();
}

// ------------------------------------------------------------------
// Purge events
// ------------------------------------------------------------------

Result MemoryRepository::InsertPurgeEvent(Transaction& t, model::PurgeEventRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.origins.contains(r.origin_id)) return MissingOrigin(r.origin_id);

  r.id                 = s.next_purge_id++;
  s.purge_events[r.id] = r;
  return Result::Ok();
}

std::vector<model::PurgeEventRecord> MemoryRepository::ListRecentPurgeEvents(Transaction& t, uint64_t limit) {
  std::vector<model::PurgeEventRecord> out;
  for (const auto& [_, event] : TX(t).View().purge_events) {
    out.push_back(event);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

uint64_t MemoryRepository::CountPurgeEvents(Transaction& t, std::optional<uint64_t> created_after_ms) {
  const auto& events = TX(t).View().purge_events;
  if (!created_after_ms) return events.size();
  return std::count_if(events.begin(), events.end(), [&](const auto& entry) { return entry.second.created_at_ms > *created_after_ms; });
}

} // namespace cdn::db::memory
