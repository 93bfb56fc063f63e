#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cdn::db::model {

/*
  Persistent origin row.

  status is kept as stored text; values outside
  active|paused|error are carried through untouched.
*/

struct OriginRecord {
  int64_t id = 0; // assigned by InsertOrigin

  std::string name;
  std::string origin_url;
  std::string cdn_url;
  std::string provider = "cloudflare";
  std::string status   = "active";
  int64_t     cache_ttl = 3600;
  std::string notes;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> last_purge_ms;
};

} // namespace cdn::db::model
