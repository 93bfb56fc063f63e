#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace cdn::db::memory {

class MemoryTransaction;

/*
  In-process backend with snapshot isolation.

  Mirrors the SQL schema's constraints: unique origin names,
  foreign keys from rules/purge events to origins.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertOrigin(Transaction&, model::OriginRecord&) override;
  std::optional<model::OriginRecord> GetOrigin(Transaction&, int64_t id) override;
  std::vector<model::OriginRecord> ListOrigins(Transaction&, const std::optional<std::string>& provider) override;
  Result UpdateOriginLastPurge(Transaction&, int64_t id, uint64_t last_purge_ms) override;
  Result UpdateOriginStatus(Transaction&, int64_t id, const std::string& status) override;

  Result InsertCacheRule(Transaction&, model::CacheRuleRecord&) override;
  std::vector<model::CacheRuleRecord> ListCacheRules(Transaction&, std::optional<int64_t> origin_id) override;
  uint64_t CountCacheRules(Transaction&) override;

  Result InsertPurgeEvent(Transaction&, model::PurgeEventRecord&) override;
  std::vector<model::PurgeEventRecord> ListRecentPurgeEvents(Transaction&, uint64_t limit) override;
  uint64_t CountPurgeEvents(Transaction&, std::optional<uint64_t> created_after_ms) override;

private:
  friend class MemoryTransaction;

  struct State {
    // keyed by id, so iteration is insertion order
    std::map<int64_t, model::OriginRecord> origins;
    std::map<int64_t, model::CacheRuleRecord> cache_rules;
    std::map<int64_t, model::PurgeEventRecord> purge_events;

    int64_t next_origin_id = 1;
    int64_t next_rule_id   = 1;
    int64_t next_purge_id  = 1;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
