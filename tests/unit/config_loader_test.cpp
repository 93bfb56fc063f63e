#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using cdn::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "cdn_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\cdn\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\cdn\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(export:
  default_path: "2024"
  recent_purge_limit: 25
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.export_().default_path() == "2024");
  assert(config.export_().recent_purge_limit() == 25);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(unknown_field: 123
database:
  sqlite:
    path: "/tmp/data"
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/cdn-manager/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyDocumentFinalizesToDefaults() {
  ::setenv("HOME", "/home/cdn-test", 1);
  ::unsetenv("CDN_DB_PATH");

  const auto yaml_path = WriteYaml("empty", "");
  auto       config    = ConfigLoader::LoadFromYaml(yaml_path.string());
  ConfigLoader::Finalize(config);

  assert(config.logging().level() == "warn");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/home/cdn-test/.cdn-manager/cdn-manager.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.export_().default_path() == "cdn_export.json");
  assert(config.export_().recent_purge_limit() == 100);
}

void TestExplicitWalModeFalseSurvivesFinalize() {
  ::unsetenv("CDN_DB_PATH");

  const auto yaml_path = WriteYaml("wal_off",
                                   R"(database:
  sqlite:
    path: /var/lib/cdn/store.db
    wal_mode: false
    busy_timeout_ms: 250
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  ConfigLoader::Finalize(config);

  assert(config.database().sqlite().path() == "/var/lib/cdn/store.db");
  assert(!config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 250);
}

void TestEnvironmentOverridesSqlitePath() {
  ::setenv("HOME", "/home/cdn-test", 1);
  ::setenv("CDN_DB_PATH", "~/override.db", 1);

  auto config = ConfigLoader::Defaults();
  ConfigLoader::Finalize(config);
  assert(config.database().sqlite().path() == "/home/cdn-test/override.db");

  ::unsetenv("CDN_DB_PATH");
}

void TestMemoryAndPostgresBackends() {
  const auto memory_path = WriteYaml("memory",
                                     R"(logging:
  level: debug
database:
  memory: {}
)");

  auto memory = ConfigLoader::LoadFromYaml(memory_path.string());
  ConfigLoader::Finalize(memory);
  assert(memory.database().has_memory());
  assert(memory.logging().level() == "debug");

  const auto pg_path = WriteYaml("postgres",
                                 R"(database:
  postgres:
    connection_uri: "postgresql://cdn@localhost/cdn"
)");

  auto pg = ConfigLoader::LoadFromYaml(pg_path.string());
  ConfigLoader::Finalize(pg);
  assert(pg.database().has_postgres());
  assert(pg.database().postgres().connection_uri() == "postgresql://cdn@localhost/cdn");
  assert(pg.database().postgres().max_connections() == 4);
}

void TestExpandHome() {
  ::setenv("HOME", "/home/cdn-test", 1);
  assert(ConfigLoader::ExpandHome("~/a/b.db") == "/home/cdn-test/a/b.db");
  assert(ConfigLoader::ExpandHome("/abs/b.db") == "/abs/b.db");
  assert(ConfigLoader::ExpandHome("rel/~/b.db") == "rel/~/b.db");

  ::unsetenv("HOME");
  bool threw = false;
  try {
    (void)ConfigLoader::ExpandHome("~/x.db");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  ::setenv("HOME", "/home/cdn-test", 1);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestEmptyDocumentFinalizesToDefaults();
  TestExplicitWalModeFalseSurvivesFinalize();
  TestEnvironmentOverridesSqlitePath();
  TestMemoryAndPostgresBackends();
  TestExpandHome();

  std::cout << "cdn_manager_unit_config_loader: pass\n";
  return 0;
}
