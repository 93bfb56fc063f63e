#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cdn/manager/v1.hpp"
#include "internal/model/origin_status.hpp"
#include "internal/model/purge_type.hpp"
#include "internal/model/rule_type.hpp"
#include "internal/util/time.hpp"

namespace cdn::db {
class Repository;
}

namespace cdn::core {

struct OriginSpec {
  std::string name;
  std::string origin_url;
  std::string cdn_url;
  std::string provider  = cdn::manager::v1::kDefaultProvider;
  int64_t     cache_ttl = cdn::manager::v1::kDefaultCacheTtlSeconds;
  std::string notes;
};

struct CacheRuleSpec {
  int64_t         origin_id = 0;
  std::string     path_pattern;
  int64_t         ttl           = cdn::manager::v1::kDefaultCacheTtlSeconds;
  bool            cache_headers = true;
  model::RuleType rule_type     = model::RuleType::kCache;
};

struct PurgeSpec {
  int64_t          origin_id    = 0;
  model::PurgeType purge_type   = model::PurgeType::kFull;
  std::string      target       = cdn::manager::v1::kDefaultPurgeTarget;
  std::string      triggered_by = cdn::manager::v1::kDefaultTriggeredBy;
};

struct StoreOptions {
  // most recent purge events carried by ExportAll()
  uint64_t recent_purge_limit = cdn::manager::v1::kDefaultRecentPurgeLimit;
};

/*
  ConfigStore

  Durable home for origins, cache rules and purge events.

  - Every operation is one repository transaction; nothing is
    applied unless the whole operation succeeds.
  - Origin ids referenced by rules/purges are verified; unknown
    ids raise util::NotFound and nothing is written.
  - Errors: util::AlreadyExists, NotFound, InvalidArgument,
    InvalidState, StorageUnavailable. No internal retries.
*/
class ConfigStore {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit ConfigStore(std::shared_ptr<db::Repository> repository, ClockFn clock = util::Now, StoreOptions options = {});

  cdn::manager::v1::Origin AddOrigin(const OriginSpec& spec);

  cdn::manager::v1::Origin GetOrigin(int64_t origin_id);

  // Ascending by name. Empty result when nothing matches.
  std::vector<cdn::manager::v1::Origin> ListOrigins(const std::optional<std::string>& provider = std::nullopt);

  cdn::manager::v1::Origin SetOriginStatus(int64_t origin_id, model::OriginStatus status);

  cdn::manager::v1::CacheRule AddCacheRule(const CacheRuleSpec& spec);

  // Insertion order; restricted to one origin when given.
  std::vector<cdn::manager::v1::CacheRule> ListCacheRules(std::optional<int64_t> origin_id = std::nullopt);

  // Records a queued purge and stamps the origin's last_purge atomically.
  cdn::manager::v1::PurgeEvent PurgeCache(const PurgeSpec& spec);

  cdn::manager::v1::StatusSummary CdnStatus();

  cdn::manager::v1::ExportDocument ExportAll();

 private:
  std::shared_ptr<db::Repository> repository_;
  ClockFn                         clock_;
  StoreOptions                    options_;
};

} // namespace cdn::core
