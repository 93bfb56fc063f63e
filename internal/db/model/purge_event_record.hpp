#pragma once

#include <cstdint>
#include <string>

namespace cdn::db::model {

/*
  Immutable once written. status is always "queued" when
  created by the store.
*/

struct PurgeEventRecord {
  int64_t     id        = 0;
  int64_t     origin_id = 0;
  std::string purge_type   = "full";
  std::string target       = "*";
  std::string status       = "queued";
  std::string triggered_by = "cli";
  uint64_t    created_at_ms = 0;
};

} // namespace cdn::db::model
