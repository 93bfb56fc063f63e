#pragma once

#include <cstdint>
#include <string>

namespace cdn::db::model {

struct CacheRuleRecord {
  int64_t     id        = 0;
  int64_t     origin_id = 0;
  std::string path_pattern;
  int64_t     ttl           = 3600;
  bool        cache_headers = true;
  std::string rule_type     = "cache";
  uint64_t    created_at_ms = 0;
};

} // namespace cdn::db::model
