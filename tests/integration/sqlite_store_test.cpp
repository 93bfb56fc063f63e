#include <sys/wait.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/core/config_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using cdn::core::ConfigStore;
using cdn::core::OriginSpec;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / ("cdn_manager_sqlite_store_" + name + "_" + std::to_string(NowMs()));
  std::filesystem::remove_all(dir);
  return dir;
}

cdn::runtime::config::RuntimeConfig SqliteConfig(const std::string& path) {
  cdn::runtime::config::RuntimeConfig config;
  auto* sqlite = config.mutable_database()->mutable_sqlite();
  sqlite->set_path(path);
  sqlite->set_wal_mode(true);
  sqlite->set_busy_timeout_ms(100);
  return config;
}

OriginSpec MakeOrigin(const std::string& name) {
  OriginSpec spec;
  spec.name       = name;
  spec.origin_url = "https://" + name + ".origin.example";
  spec.cdn_url    = "https://" + name + ".cdn.example";
  return spec;
}

void TestDataSurvivesReopen() {
  const auto dir  = FreshDir("reopen");
  const auto path = (dir / "nested" / "cdn-manager.db").string();

  int64_t origin_id = 0;
  {
    auto app   = cdn::factory::Build(SqliteConfig(path));
    auto shop  = app.store->AddOrigin(MakeOrigin("shop"));
    origin_id  = shop.id();
    app.store->AddCacheRule({origin_id, "/static/*", 86400});
    app.store->PurgeCache({origin_id});
  }

  // parent directories are created on first open
  assert(std::filesystem::exists(path));

  auto app    = cdn::factory::Build(SqliteConfig(path));
  auto status = app.store->CdnStatus();
  assert(status.total_origins() == 1);
  assert(status.total_rules() == 1);
  assert(status.total_purges() == 1);
  assert(status.purges_24h() == 1);

  auto origin = app.store->GetOrigin(origin_id);
  assert(origin.name() == "shop");
  assert(origin.has_last_purge());

  // ids continue after reopen
  auto next = app.store->AddOrigin(MakeOrigin("blog"));
  assert(next.id() > origin_id);

  std::filesystem::remove_all(dir);
}

void TestMigrationsAreRecordedOnce() {
  const auto dir  = FreshDir("migrations");
  const auto path = (dir / "store.db").string();

  cdn::factory::OpenSqliteRepository(path);
  cdn::factory::OpenSqliteRepository(path);

  cdn::db::sqlite::SqliteDB db(path);
  auto                      st = db.Prepare("SELECT COUNT(*), MAX(version) FROM schema_migrations;");
  assert(sqlite3_step(st.get()) == SQLITE_ROW);
  assert(sqlite3_column_int(st.get(), 0) == 2);
  assert(sqlite3_column_int(st.get(), 1) == 2);

  std::filesystem::remove_all(dir);
}

void TestCreatedAtColumnsDefaultToNow() {
  const auto dir  = FreshDir("defaults");
  const auto path = (dir / "store.db").string();

  cdn::factory::OpenSqliteRepository(path);

  const auto before_ms = NowMs() / 1000 * 1000;

  cdn::db::sqlite::SqliteDB db(path);
  db.Exec("INSERT INTO origins(name,origin_url,cdn_url) VALUES('raw','https://raw.origin.example','https://raw.cdn.example');");
  db.Exec("INSERT INTO cache_rules(origin_id,path_pattern) SELECT id,'/raw/*' FROM origins WHERE name='raw';");
  db.Exec("INSERT INTO purge_events(origin_id) SELECT id FROM origins WHERE name='raw';");

  for (const char* table : {"origins", "cache_rules", "purge_events"}) {
    auto st = db.Prepare(std::string("SELECT created_at_ms FROM ") + table + ";");
    assert(sqlite3_step(st.get()) == SQLITE_ROW);
    const auto created_at_ms = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
    assert(created_at_ms >= before_ms);
    assert(created_at_ms % 1000 == 0);
  }

  std::filesystem::remove_all(dir);
}

void TestProcessDeathMidPurgeLeavesNoTrace() {
  const auto dir  = FreshDir("kill");
  const auto path = (dir / "store.db").string();

  int64_t origin_id = 0;
  {
    auto app  = cdn::factory::Build(SqliteConfig(path));
    origin_id = app.store->AddOrigin(MakeOrigin("victim")).id();
  }

  pid_t pid = fork();
  assert(pid >= 0);
  if (pid == 0) {
    // first purge write lands, then the process dies before the second
    auto repo = cdn::factory::OpenSqliteRepository(path);
    auto tx   = repo->Begin();

    cdn::db::model::PurgeEventRecord event;
    event.origin_id     = origin_id;
    event.created_at_ms = NowMs();
    if (!repo->InsertPurgeEvent(*tx, event)) {
      _exit(3);
    }
    _exit(0);
  }

  int wstatus = 0;
  assert(waitpid(pid, &wstatus, 0) == pid);
  assert(WIFEXITED(wstatus) && WEXITSTATUS(wstatus) == 0);

  auto app = cdn::factory::Build(SqliteConfig(path));
  assert(app.store->CdnStatus().total_purges() == 0);
  assert(!app.store->GetOrigin(origin_id).has_last_purge());

  // the store remains writable after recovery
  app.store->PurgeCache({origin_id});
  assert(app.store->CdnStatus().total_purges() == 1);

  std::filesystem::remove_all(dir);
}

void TestHeldLockSurfacesAsStorageUnavailable() {
  const auto dir  = FreshDir("busy");
  const auto path = (dir / "store.db").string();

  auto holder = cdn::factory::OpenSqliteRepository(path, true, 100);
  auto other  = cdn::factory::Build(SqliteConfig(path));

  auto lock = holder->Begin();

  bool threw = false;
  try {
    other.store->AddOrigin(MakeOrigin("blocked"));
  } catch (const cdn::util::StorageUnavailable&) {
    threw = true;
  }
  assert(threw);

  lock->Rollback();
  other.store->AddOrigin(MakeOrigin("unblocked"));
  assert(other.store->ListOrigins().size() == 1);

  std::filesystem::remove_all(dir);
}

void TestUnopenablePathSurfacesAsStorageUnavailable() {
  const auto dir = FreshDir("unopenable");
  std::filesystem::create_directories(dir);

  const auto blocker = dir / "not-a-directory";
  {
    std::ofstream out(blocker);
    out << "x";
  }

  bool threw = false;
  try {
    cdn::factory::Build(SqliteConfig((blocker / "store.db").string()));
  } catch (const cdn::util::StorageUnavailable&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestDataSurvivesReopen();
  TestMigrationsAreRecordedOnce();
  TestCreatedAtColumnsDefaultToNow();
  TestProcessDeathMidPurgeLeavesNoTrace();
  TestHeldLockSurfacesAsStorageUnavailable();
  TestUnopenablePathSurfacesAsStorageUnavailable();

  std::cout << "cdn_manager_integration_sqlite_store: pass\n";
  return 0;
}
