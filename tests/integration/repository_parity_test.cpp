#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"

#if CDN_DB_POSTGRES
#include "internal/db/postgres/pg_migrations.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#endif

namespace {

using cdn::db::ErrorCode;
using cdn::db::Repository;
using cdn::db::memory::MemoryRepository;
using cdn::db::model::CacheRuleRecord;
using cdn::db::model::OriginRecord;
using cdn::db::model::PurgeEventRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

OriginRecord MakeOrigin(const std::string& name, const std::string& provider = "cloudflare") {
  OriginRecord origin;
  origin.name          = name;
  origin.origin_url    = "https://" + name + ".origin.example";
  origin.cdn_url       = "https://" + name + ".cdn.example";
  origin.provider      = provider;
  origin.created_at_ms = NowMs();
  return origin;
}

void VerifyOriginLifecycle(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  auto first = MakeOrigin(prefix + "-b", "fastly");
  assert(repo.InsertOrigin(*tx, first));
  assert(first.id > 0);

  auto second  = MakeOrigin(prefix + "-a", "fastly");
  second.notes = "secondary";
  assert(repo.InsertOrigin(*tx, second));
  assert(second.id > first.id);

  auto loaded = repo.GetOrigin(*tx, first.id);
  assert(loaded.has_value());
  assert(loaded->name == first.name);
  assert(loaded->status == "active");
  assert(loaded->cache_ttl == 3600);
  assert(loaded->created_at_ms == first.created_at_ms);
  assert(!loaded->last_purge_ms.has_value());

  assert(repo.UpdateOriginLastPurge(*tx, first.id, 1234));
  assert(repo.UpdateOriginStatus(*tx, first.id, "paused"));
  tx->Commit();

  auto verify = repo.Begin();
  loaded      = repo.GetOrigin(*verify, first.id);
  assert(loaded->last_purge_ms.value() == 1234);
  assert(loaded->status == "paused");

  auto fastly = repo.ListOrigins(*verify, std::string("fastly"));
  std::vector<std::string> names;
  for (const auto& origin : fastly) {
    if (origin.name.rfind(prefix + "-", 0) == 0) names.push_back(origin.name);
  }
  assert(names.size() == 2);
  assert(names[0] == prefix + "-a");
  assert(names[1] == prefix + "-b");

  assert(!repo.GetOrigin(*verify, 987654321).has_value());
  verify->Commit();
}

void VerifyUpdatesOnMissingOrigin(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.UpdateOriginLastPurge(*tx, 987654321, 1).code == ErrorCode::NotFound);
  assert(repo.UpdateOriginStatus(*tx, 987654321, "error").code == ErrorCode::NotFound);
  tx->Rollback();
}

void VerifyUniqueNames(Repository& repo, const std::string& prefix) {
  {
    auto tx     = repo.Begin();
    auto origin = MakeOrigin(prefix + "-unique");
    assert(repo.InsertOrigin(*tx, origin));
    tx->Commit();
  }

  auto tx        = repo.Begin();
  auto duplicate = MakeOrigin(prefix + "-unique", "bunny");
  auto result    = repo.InsertOrigin(*tx, duplicate);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyReferencesRequireOrigin(Repository& repo) {
  {
    auto            tx = repo.Begin();
    CacheRuleRecord rule;
    rule.origin_id     = 987654321;
    rule.path_pattern  = "/orphan/*";
    rule.created_at_ms = NowMs();
    assert(repo.InsertCacheRule(*tx, rule).code == ErrorCode::NotFound);
    tx->Rollback();
  }
  {
    auto             tx = repo.Begin();
    PurgeEventRecord event;
    event.origin_id     = 987654321;
    event.created_at_ms = NowMs();
    assert(repo.InsertPurgeEvent(*tx, event).code == ErrorCode::NotFound);
    tx->Rollback();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  int64_t id = 0;
  {
    auto tx     = repo.Begin();
    auto origin = MakeOrigin(prefix + "-rollback");
    assert(repo.InsertOrigin(*tx, origin));
    id = origin.id;
    tx->Rollback();
  }
  {
    // destroyed without Commit
    auto tx     = repo.Begin();
    auto origin = MakeOrigin(prefix + "-dropped");
    assert(repo.InsertOrigin(*tx, origin));
  }

  auto tx = repo.Begin();
  assert(!repo.GetOrigin(*tx, id).has_value());
  for (const auto& origin : repo.ListOrigins(*tx, std::nullopt)) {
    assert(origin.name != prefix + "-rollback");
    assert(origin.name != prefix + "-dropped");
  }
  tx->Commit();
}

void VerifyRulesAndPurges(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const uint64_t rules_before  = repo.CountCacheRules(*tx);
  const uint64_t purges_before = repo.CountPurgeEvents(*tx, std::nullopt);

  auto origin = MakeOrigin(prefix + "-rules");
  assert(repo.InsertOrigin(*tx, origin));

  std::vector<int64_t> rule_ids;
  for (const char* pattern : {"/static/*", "/api/*", "/video/*"}) {
    CacheRuleRecord rule;
    rule.origin_id     = origin.id;
    rule.path_pattern  = pattern;
    rule.ttl           = 60;
    rule.cache_headers = false;
    rule.rule_type     = "bypass";
    rule.created_at_ms = NowMs();
    assert(repo.InsertCacheRule(*tx, rule));
    rule_ids.push_back(rule.id);
  }

  auto rules = repo.ListCacheRules(*tx, origin.id);
  assert(rules.size() == 3);
  assert(rules[0].id == rule_ids[0] && rules[0].path_pattern == "/static/*");
  assert(rules[2].id == rule_ids[2] && rules[2].path_pattern == "/video/*");
  assert(!rules[1].cache_headers);
  assert(rules[1].rule_type == "bypass");
  assert(repo.CountCacheRules(*tx) == rules_before + 3);

  // newer than anything a previous run left behind
  const uint64_t base = NowMs() + 3600 * 1000;
  std::vector<int64_t> event_ids;
  for (uint64_t offset : {0ULL, 10ULL, 10ULL, 20ULL}) {
    PurgeEventRecord event;
    event.origin_id     = origin.id;
    event.target        = "/img/" + std::to_string(offset);
    event.created_at_ms = base + offset;
    assert(repo.InsertPurgeEvent(*tx, event));
    event_ids.push_back(event.id);
  }

  assert(repo.CountPurgeEvents(*tx, std::nullopt) == purges_before + 4);
  // strictly after
  assert(repo.CountPurgeEvents(*tx, base + 10) == 1);
  assert(repo.CountPurgeEvents(*tx, base) == 3);

  auto recent = repo.ListRecentPurgeEvents(*tx, 3);
  assert(recent.size() == 3);
  assert(recent[0].id == event_ids[3]);
  assert(recent[1].id == event_ids[2]);
  assert(recent[2].id == event_ids[1]);
  assert(recent[0].status == "queued");
  assert(recent[0].triggered_by == "cli");
  assert(recent[0].purge_type == "full");

  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto    repo = backend.make_repository();
  int64_t id   = 0;
  {
    auto tx     = repo->Begin();
    auto origin = MakeOrigin(prefix + "-durable");
    assert(repo->InsertOrigin(*tx, origin));
    id = origin.id;

    CacheRuleRecord rule;
    rule.origin_id     = id;
    rule.path_pattern  = "/durable/*";
    rule.created_at_ms = NowMs();
    assert(repo->InsertCacheRule(*tx, rule));

    assert(repo->UpdateOriginLastPurge(*tx, id, 4242));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto origin = repo->GetOrigin(*tx, id);
  assert(origin.has_value());
  assert(origin->name == prefix + "-durable");
  assert(origin->last_purge_ms.value() == 4242);

  auto rules = repo->ListCacheRules(*tx, id);
  assert(rules.size() == 1);
  assert(rules[0].path_pattern == "/durable/*");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if CDN_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("cdn_manager_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() { return cdn::factory::OpenSqliteRepository(db_path); };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if CDN_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("CDN_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("CDN_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    {
      cdn::db::postgres::PgMigrationExecutor executor(conninfo);
      cdn::db::sql::RunMigrations(executor, cdn::db::sql::PostgresMigrations());
    }

    return std::make_shared<cdn::db::postgres::PgRepository>(std::make_shared<cdn::db::postgres::PgPool>(conninfo));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // origin names are unique across runs against a shared database
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyOriginLifecycle(*repo, prefix);
  VerifyUpdatesOnMissingOrigin(*repo);
  VerifyUniqueNames(*repo, prefix);
  VerifyReferencesRequireOrigin(*repo);
  VerifyRollbackBehavior(*repo, prefix);
  VerifyRulesAndPurges(*repo, prefix);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if CDN_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if CDN_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "cdn_manager_integration_repository_parity: pass\n";
  return 0;
}
