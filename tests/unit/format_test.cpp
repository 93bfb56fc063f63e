#include "internal/display/format.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/util/time.hpp"

namespace {

using cdn::display::CategorizeStatus;
using cdn::display::Palette;
using cdn::display::StatusCategory;
using cdn::display::TtlLabel;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestTtlLabels() {
  assert(TtlLabel(0) == "0s");
  assert(TtlLabel(45) == "45s");
  assert(TtlLabel(59) == "59s");
  assert(TtlLabel(60) == "1m");
  assert(TtlLabel(120) == "2m");
  assert(TtlLabel(3599) == "59m");
  assert(TtlLabel(3600) == "1h");
  assert(TtlLabel(7200) == "2h");
  assert(TtlLabel(86399) == "23h");
  assert(TtlLabel(86400) == "1d");
  assert(TtlLabel(172800) == "2d");
}

void TestStatusCategories() {
  assert(CategorizeStatus("active") == StatusCategory::kHealthy);
  assert(CategorizeStatus("error") == StatusCategory::kAlarm);
  assert(CategorizeStatus("paused") == StatusCategory::kWarning);
  assert(CategorizeStatus("retired") == StatusCategory::kNeutral);
  assert(CategorizeStatus("") == StatusCategory::kNeutral);

  assert(std::string(cdn::display::CategoryColor(StatusCategory::kHealthy)) == cdn::display::ansi::kGreen);
  assert(std::string(cdn::display::CategoryColor(StatusCategory::kAlarm)) == cdn::display::ansi::kRed);
  assert(std::string(cdn::display::CategoryColor(StatusCategory::kWarning)) == cdn::display::ansi::kYellow);
}

cdn::manager::v1::Origin SampleOrigin() {
  cdn::manager::v1::Origin origin;
  origin.set_id(7);
  origin.set_name("shop");
  origin.set_origin_url("https://shop.origin.example");
  origin.set_cdn_url("https://shop.cdn.example");
  origin.set_provider("fastly");
  origin.set_status("paused");
  origin.set_cache_ttl(7200);
  *origin.mutable_created_at() = cdn::util::MillisToProto(1772366400000ULL);
  return origin;
}

void TestRenderOriginWithoutColor() {
  auto origin = SampleOrigin();

  std::ostringstream out;
  cdn::display::RenderOrigin(out, origin, Palette(false));
  const auto text = out.str();

  assert(Contains(text, "[  7] shop  (fastly)"));
  assert(Contains(text, "Status : paused   TTL: 2h"));
  assert(Contains(text, "Origin : https://shop.origin.example"));
  assert(Contains(text, "CDN    : https://shop.cdn.example"));
  assert(!Contains(text, "Purged"));
  assert(!Contains(text, "Notes"));
  assert(!Contains(text, "\033["));
}

void TestRenderOriginLastPurgeAndNotes() {
  auto origin = SampleOrigin();
  origin.set_notes("storefront");
  // 2026-03-01T12:00:00.250Z
  *origin.mutable_last_purge() = cdn::util::MillisToProto(1772366400250ULL);

  std::ostringstream out;
  cdn::display::RenderOrigin(out, origin, Palette(false));
  const auto text = out.str();

  assert(Contains(text, "Purged : 2026-03-01T12:00:00\n"));
  assert(!Contains(text, ".250"));
  assert(Contains(text, "Notes  : storefront"));
}

void TestRenderOriginWithColor() {
  auto origin = SampleOrigin();

  std::ostringstream out;
  cdn::display::RenderOrigin(out, origin, Palette(true));
  const auto text = out.str();

  assert(Contains(text, std::string(cdn::display::ansi::kYellow) + "paused"));
  assert(Contains(text, cdn::display::ansi::kReset));
}

void TestRenderStatusSummary() {
  cdn::manager::v1::StatusSummary summary;
  summary.set_total_origins(3);
  summary.set_total_rules(4);
  summary.set_total_purges(5);
  summary.set_purges_24h(2);
  (*summary.mutable_by_provider())["fastly"]     = 2;
  (*summary.mutable_by_provider())["cloudflare"] = 1;
  (*summary.mutable_by_status())["active"]       = 3;

  std::ostringstream out;
  cdn::display::RenderStatusSummary(out, summary, Palette(false));
  const auto text = out.str();

  assert(Contains(text, "CDN Fleet Status"));
  assert(Contains(text, "Origins                 3"));
  assert(Contains(text, "Cache Rules             4"));
  assert(Contains(text, "Total Purges            5"));
  assert(Contains(text, "Purges (24 h)           2"));
  assert(Contains(text, "By Provider:"));

  // providers listed alphabetically
  assert(text.find("cloudflare") < text.find("fastly"));
}

void TestRenderCacheRule() {
  cdn::manager::v1::CacheRule rule;
  rule.set_id(3);
  rule.set_origin_id(7);
  rule.set_path_pattern("/static/*");
  rule.set_ttl(86400);
  rule.set_cache_headers(false);
  rule.set_rule_type("bypass");

  std::ostringstream out;
  cdn::display::RenderCacheRule(out, rule, Palette(false));
  const auto text = out.str();

  assert(Contains(text, "[  3] /static/*  origin #7  bypass  TTL 1d"));
  assert(Contains(text, "(no cache headers)"));
}

} // namespace

int main() {
  TestTtlLabels();
  TestStatusCategories();
  TestRenderOriginWithoutColor();
  TestRenderOriginLastPurgeAndNotes();
  TestRenderOriginWithColor();
  TestRenderStatusSummary();
  TestRenderCacheRule();

  std::cout << "cdn_manager_unit_format: pass\n";
  return 0;
}
