#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace cdn::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
