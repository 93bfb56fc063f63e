#include "format.hpp"

#include <iomanip>
#include <map>

#include "internal/util/time.hpp"

namespace cdn::display {

using namespace cdn::manager::v1;

namespace {

constexpr std::size_t kSecondsPrecision = 19; // YYYY-MM-DDTHH:MM:SS

std::string Truncated(const google::protobuf::Timestamp& ts) {
  return util::FormatIso8601(ts).substr(0, kSecondsPrecision);
}

template <typename MapT>
void RenderCounts(std::ostream& out, const char* title, const MapT& counts, const Palette& palette) {
  if (counts.empty()) {
    return;
  }

  // protobuf maps are unordered
  std::map<std::string, uint64_t> sorted;
  for (const auto& entry : counts) {
    sorted.emplace(entry.first, entry.second);
  }

  out << "\n  " << palette(ansi::kBold) << title << palette(ansi::kReset) << "\n";
  for (const auto& [key, count] : sorted) {
    out << "    " << palette(ansi::kCyan) << std::left << std::setw(20) << key << palette(ansi::kReset) << " " << count << "\n";
  }
}

} // namespace

StatusCategory CategorizeStatus(std::string_view status) {
  if (status == "active") return StatusCategory::kHealthy;
  if (status == "error") return StatusCategory::kAlarm;
  if (status == "paused") return StatusCategory::kWarning;
  return StatusCategory::kNeutral;
}

const char* CategoryColor(StatusCategory category) {
  switch (category) {
    case StatusCategory::kHealthy:
      return ansi::kGreen;
    case StatusCategory::kAlarm:
      return ansi::kRed;
    case StatusCategory::kWarning:
      return ansi::kYellow;
    case StatusCategory::kNeutral:
    default:
      return ansi::kReset;
  }
}

std::string TtlLabel(int64_t ttl_seconds) {
  if (ttl_seconds < 60) return std::to_string(ttl_seconds) + "s";
  if (ttl_seconds < 3600) return std::to_string(ttl_seconds / 60) + "m";
  if (ttl_seconds < 86400) return std::to_string(ttl_seconds / 3600) + "h";
  return std::to_string(ttl_seconds / 86400) + "d";
}

void RenderBanner(std::ostream& out, const Palette& palette) {
  out << "\n" << palette(ansi::kBold) << palette(ansi::kBlue) << "╔══ CDN Manager ══╗" << palette(ansi::kReset) << "\n\n";
}

void RenderOrigin(std::ostream& out, const Origin& origin, const Palette& palette) {
  const char* status_color = CategoryColor(CategorizeStatus(origin.status()));

  out << "  " << palette(ansi::kBold) << "[" << std::right << std::setw(3) << origin.id() << "]" << palette(ansi::kReset) << " "
      << palette(ansi::kCyan) << origin.name() << palette(ansi::kReset) << "  " << palette(ansi::kBlue) << "(" << origin.provider()
      << ")" << palette(ansi::kReset) << "\n";
  out << "        Status : " << palette(status_color) << origin.status() << palette(ansi::kReset)
      << "   TTL: " << TtlLabel(origin.cache_ttl()) << "\n";
  out << "        Origin : " << origin.origin_url() << "\n";
  out << "        CDN    : " << origin.cdn_url() << "\n";
  if (origin.has_last_purge()) {
    out << "        Purged : " << palette(ansi::kYellow) << Truncated(origin.last_purge()) << palette(ansi::kReset) << "\n";
  }
  if (!origin.notes().empty()) {
    out << "        Notes  : " << origin.notes() << "\n";
  }
  out << "\n";
}

void RenderCacheRule(std::ostream& out, const CacheRule& rule, const Palette& palette) {
  out << "  " << palette(ansi::kBold) << "[" << std::right << std::setw(3) << rule.id() << "]" << palette(ansi::kReset) << " "
      << palette(ansi::kCyan) << rule.path_pattern() << palette(ansi::kReset) << "  origin #" << rule.origin_id() << "  "
      << rule.rule_type() << "  TTL " << TtlLabel(rule.ttl()) << (rule.cache_headers() ? "" : "  (no cache headers)") << "\n";
}

void RenderPurgeEvent(std::ostream& out, const PurgeEvent& event, const Palette& palette) {
  out << "  " << palette(ansi::kGreen) << "✓ Purge queued (event #" << event.id() << ")" << palette(ansi::kReset) << "\n";
  out << "  " << palette(ansi::kYellow) << "Origin #" << event.origin_id() << "  type=" << event.purge_type()
      << "  target=" << event.target() << palette(ansi::kReset) << "\n\n";
}

void RenderStatusSummary(std::ostream& out, const StatusSummary& summary, const Palette& palette) {
  out << "  " << palette(ansi::kBold) << "CDN Fleet Status" << palette(ansi::kReset) << "\n";
  out << "  " << std::left << std::setw(22) << "Origins" << "  " << palette(ansi::kCyan) << summary.total_origins()
      << palette(ansi::kReset) << "\n";
  out << "  " << std::left << std::setw(22) << "Cache Rules" << "  " << summary.total_rules() << "\n";
  out << "  " << std::left << std::setw(22) << "Total Purges" << "  " << summary.total_purges() << "\n";
  out << "  " << std::left << std::setw(22) << "Purges (24 h)" << "  " << palette(ansi::kYellow) << summary.purges_24h()
      << palette(ansi::kReset) << "\n";

  RenderCounts(out, "By Provider:", summary.by_provider(), palette);
  RenderCounts(out, "By Status:", summary.by_status(), palette);
  out << "\n";
}

} // namespace cdn::display
