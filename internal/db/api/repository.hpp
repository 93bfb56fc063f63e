#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_rule_record.hpp"
#include "internal/db/model/origin_record.hpp"
#include "internal/db/model/purge_event_record.hpp"

namespace cdn::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Insert* assigns record.id; ids are never reused once committed
  - Origin names are unique (AlreadyExists)
  - Rules and purge events must reference an existing origin (NotFound)

  Writes report failure through Result; reads throw DbError.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Origins
  // ---------------------------------------------------------------------

  virtual Result InsertOrigin(Transaction&, model::OriginRecord&) = 0;

  virtual std::optional<model::OriginRecord> GetOrigin(Transaction&, int64_t id) = 0;

  // Ascending by name; provider filter is an exact match.
  virtual std::vector<model::OriginRecord> ListOrigins(Transaction&, const std::optional<std::string>& provider) = 0;

  virtual Result UpdateOriginLastPurge(Transaction&, int64_t id, uint64_t last_purge_ms) = 0;

  virtual Result UpdateOriginStatus(Transaction&, int64_t id, const std::string& status) = 0;

  // ---------------------------------------------------------------------
  // Cache rules
  // ---------------------------------------------------------------------

  virtual Result InsertCacheRule(Transaction&, model::CacheRuleRecord&) = 0;

  // Insertion order.
  virtual std::vector<model::CacheRuleRecord> ListCacheRules(Transaction&, std::optional<int64_t> origin_id) = 0;

  virtual uint64_t CountCacheRules(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Purge events
  // ---------------------------------------------------------------------

  virtual Result InsertPurgeEvent(Transaction&, model::PurgeEventRecord&) = 0;

  // Newest first (created_at_ms DESC, id DESC).
  virtual std::vector<model::PurgeEventRecord> ListRecentPurgeEvents(Transaction&, uint64_t limit) = 0;

  // Counts events with created_at_ms strictly greater than created_after_ms when given.
  virtual uint64_t CountPurgeEvents(Transaction&, std::optional<uint64_t> created_after_ms) = 0;
};

} // namespace cdn::db
