#pragma once

#include "cdn/manager/v1/types.pb.h"

namespace cdn::manager::v1 {

inline constexpr const char* kDefaultProvider    = "cloudflare";
inline constexpr const char* kDefaultPurgeTarget = "*";
inline constexpr const char* kDefaultTriggeredBy = "cli";
inline constexpr const char* kDefaultExportPath  = "cdn_export.json";

inline constexpr long long kDefaultCacheTtlSeconds = 3600;
inline constexpr unsigned  kDefaultRecentPurgeLimit = 100;

} // namespace cdn::manager::v1
