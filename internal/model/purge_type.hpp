#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace cdn::model {

enum class PurgeType : std::uint8_t {
  kFull = 0,
  kPath = 1,
  kTag  = 2,
};

// Events are recorded as kQueued; nothing in this tool executes a purge.
enum class PurgeStatus : std::uint8_t {
  kQueued   = 0,
  kComplete = 1,
  kFailed   = 2,
};

constexpr std::string_view ToString(PurgeType type) {
  switch (type) {
    case PurgeType::kPath:
      return "path";
    case PurgeType::kTag:
      return "tag";
    case PurgeType::kFull:
    default:
      return "full";
  }
}

constexpr std::string_view ToString(PurgeStatus status) {
  switch (status) {
    case PurgeStatus::kComplete:
      return "complete";
    case PurgeStatus::kFailed:
      return "failed";
    case PurgeStatus::kQueued:
    default:
      return "queued";
  }
}

constexpr std::optional<PurgeType> ParsePurgeType(std::string_view value) {
  if (value == "full") return PurgeType::kFull;
  if (value == "path") return PurgeType::kPath;
  if (value == "tag") return PurgeType::kTag;
  return std::nullopt;
}

}  // namespace cdn::model
