#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "cdn/manager/v1.hpp"

namespace cdn::display {

namespace ansi {
inline constexpr const char* kGreen  = "\033[0;32m";
inline constexpr const char* kRed    = "\033[0;31m";
inline constexpr const char* kYellow = "\033[1;33m";
inline constexpr const char* kCyan   = "\033[0;36m";
inline constexpr const char* kBlue   = "\033[0;34m";
inline constexpr const char* kBold   = "\033[1m";
inline constexpr const char* kReset  = "\033[0m";
} // namespace ansi

enum class StatusCategory {
  kHealthy,
  kAlarm,
  kWarning,
  kNeutral,
};

// active -> healthy, error -> alarm, paused -> warning, anything else neutral.
StatusCategory CategorizeStatus(std::string_view status);

const char* CategoryColor(StatusCategory category);

// 45 -> "45s", 120 -> "2m", 7200 -> "2h", 172800 -> "2d"
std::string TtlLabel(int64_t ttl_seconds);

/*
  Palette

  Resolves escape codes; a palette built with color=false
  renders every code as the empty string.
*/
class Palette {
 public:
  explicit Palette(bool color = true) : color_(color) {
  }

  const char* operator()(const char* code) const {
    return color_ ? code : "";
  }

 private:
  bool color_;
};

void RenderBanner(std::ostream& out, const Palette& palette);

void RenderOrigin(std::ostream& out, const cdn::manager::v1::Origin& origin, const Palette& palette);

void RenderCacheRule(std::ostream& out, const cdn::manager::v1::CacheRule& rule, const Palette& palette);

void RenderPurgeEvent(std::ostream& out, const cdn::manager::v1::PurgeEvent& event, const Palette& palette);

void RenderStatusSummary(std::ostream& out, const cdn::manager::v1::StatusSummary& summary, const Palette& palette);

} // namespace cdn::display
