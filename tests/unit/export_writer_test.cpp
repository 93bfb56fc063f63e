#include "internal/export/export_writer.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

std::filesystem::path TestDir() {
  const auto dir = std::filesystem::temp_directory_path() / "cdn_manager_export_writer_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

cdn::manager::v1::ExportDocument SampleDocument() {
  cdn::manager::v1::ExportDocument doc;
  *doc.mutable_exported_at() = cdn::util::MillisToProto(1772366400000ULL);

  auto* origin = doc.add_origins();
  origin->set_id(1);
  origin->set_name("shop");
  origin->set_origin_url("https://shop.origin.example");
  origin->set_cdn_url("https://shop.cdn.example");
  origin->set_provider("cloudflare");
  origin->set_status("active");
  origin->set_cache_ttl(3600);
  *origin->mutable_created_at() = cdn::util::MillisToProto(1772366400000ULL);
  *origin->mutable_last_purge() = cdn::util::MillisToProto(1772366405000ULL);

  auto* rule = doc.add_cache_rules();
  rule->set_id(1);
  rule->set_origin_id(1);
  rule->set_path_pattern("/static/*");
  rule->set_ttl(86400);
  rule->set_cache_headers(true);
  rule->set_rule_type("cache");

  auto* event = doc.add_recent_purge_events();
  event->set_id(1);
  event->set_origin_id(1);
  event->set_purge_type("full");
  event->set_target("*");
  event->set_status("queued");
  event->set_triggered_by("cli");
  *event->mutable_created_at() = cdn::util::MillisToProto(1772366405000ULL);
  return doc;
}

void TestJsonUsesDeclaredFieldNames() {
  const auto json = cdn::exporter::ToJson(SampleDocument());

  assert(json.find("\"exported_at\"") != std::string::npos);
  assert(json.find("\"recent_purge_events\"") != std::string::npos);
  assert(json.find("\"origin_url\"") != std::string::npos);
  assert(json.find("\"path_pattern\"") != std::string::npos);
  assert(json.find("\"2026-03-01T12:00:05Z\"") != std::string::npos);
  // empty notes is still printed
  assert(json.find("\"notes\"") != std::string::npos);
  assert(json.find('\n') != std::string::npos);
}

void TestIntegersAndUnsetLastPurge() {
  auto doc = SampleDocument();

  auto* fresh = doc.add_origins();
  fresh->set_id(2);
  fresh->set_name("blog");
  fresh->set_origin_url("https://blog.origin.example");
  fresh->set_cdn_url("https://blog.cdn.example");
  fresh->set_provider("fastly");
  fresh->set_status("active");
  fresh->set_cache_ttl(7200);
  *fresh->mutable_created_at() = cdn::util::MillisToProto(1772366400000ULL);

  const auto json = cdn::exporter::ToJson(doc);

  assert(json.find("\"last_purge\": null") != std::string::npos);
  assert(json.find("\"cache_ttl\": 7200") != std::string::npos);
  assert(json.find("\"ttl\": 86400") != std::string::npos);
  assert(json.find("\"origin_id\": 1") != std::string::npos);
  assert(json.find("\"id\": 2") != std::string::npos);
  assert(json.find("\"7200\"") == std::string::npos);

  // still readable as the document type
  cdn::manager::v1::ExportDocument parsed;
  assert(google::protobuf::util::JsonStringToMessage(json, &parsed).ok());
  assert(parsed.origins_size() == 2);
  assert(!parsed.origins(1).has_last_purge());
  assert(parsed.origins(1).cache_ttl() == 7200);
  assert(parsed.origins(0).last_purge().seconds() == 1772366405);
}

void TestWriteExportReplacesFileAtomically() {
  const auto path = (TestDir() / "export.json").string();
  std::filesystem::remove(path);

  {
    std::ofstream stale(path);
    stale << "stale";
  }

  auto written = cdn::exporter::WriteExport(SampleDocument(), path);
  assert(written == path);
  assert(!std::filesystem::exists(path + ".tmp"));

  cdn::manager::v1::ExportDocument parsed;
  auto status = google::protobuf::util::JsonStringToMessage(ReadFile(path), &parsed);
  assert(status.ok());
  assert(parsed.origins_size() == 1);
  assert(parsed.origins(0).name() == "shop");
  assert(parsed.origins(0).last_purge().seconds() == 1772366405);
  assert(parsed.cache_rules(0).ttl() == 86400);
  assert(parsed.recent_purge_events(0).status() == "queued");
}

void TestEmptyDocument() {
  cdn::manager::v1::ExportDocument doc;
  *doc.mutable_exported_at() = cdn::util::MillisToProto(1772366400000ULL);

  const auto path = (TestDir() / "empty.json").string();
  cdn::exporter::WriteExport(doc, path);

  cdn::manager::v1::ExportDocument parsed;
  assert(google::protobuf::util::JsonStringToMessage(ReadFile(path), &parsed).ok());
  assert(parsed.origins_size() == 0);
  assert(parsed.exported_at().seconds() == 1772366400);
}

void TestUnwritableDestinationRaisesStorageUnavailable() {
  const auto path = (TestDir() / "missing-dir" / "nested" / "export.json").string();

  bool threw = false;
  try {
    cdn::exporter::WriteExport(SampleDocument(), path);
  } catch (const cdn::util::StorageUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(path));
}

} // namespace

int main() {
  TestJsonUsesDeclaredFieldNames();
  TestIntegersAndUnsetLastPurge();
  TestWriteExportReplacesFileAtomically();
  TestEmptyDocument();
  TestUnwritableDestinationRaisesStorageUnavailable();

  std::cout << "cdn_manager_unit_export_writer: pass\n";
  return 0;
}
