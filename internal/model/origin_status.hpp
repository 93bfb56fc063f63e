#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace cdn::model {

enum class OriginStatus : std::uint8_t {
  kActive = 0,
  kPaused = 1,
  kError  = 2,
};

constexpr std::string_view ToString(OriginStatus status) {
  switch (status) {
    case OriginStatus::kPaused:
      return "paused";
    case OriginStatus::kError:
      return "error";
    case OriginStatus::kActive:
    default:
      return "active";
  }
}

constexpr std::optional<OriginStatus> ParseOriginStatus(std::string_view value) {
  if (value == "active") return OriginStatus::kActive;
  if (value == "paused") return OriginStatus::kPaused;
  if (value == "error") return OriginStatus::kError;
  return std::nullopt;
}

/*
  active <-> paused, and either may fall into / recover from error.
  Re-applying the current status is not a transition.
*/
constexpr bool CanTransition(OriginStatus from, OriginStatus to) {
  return from != to;
}

}  // namespace cdn::model
