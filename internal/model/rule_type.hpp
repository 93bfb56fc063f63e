#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace cdn::model {

enum class RuleType : std::uint8_t {
  kCache  = 0,
  kBypass = 1,
  kStream = 2,
};

constexpr std::string_view ToString(RuleType type) {
  switch (type) {
    case RuleType::kBypass:
      return "bypass";
    case RuleType::kStream:
      return "stream";
    case RuleType::kCache:
    default:
      return "cache";
  }
}

constexpr std::optional<RuleType> ParseRuleType(std::string_view value) {
  if (value == "cache") return RuleType::kCache;
  if (value == "bypass") return RuleType::kBypass;
  if (value == "stream") return RuleType::kStream;
  return std::nullopt;
}

}  // namespace cdn::model
