#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/core/config_store.hpp"
#include "internal/db/api/repository.hpp"

namespace cdn::factory {

/*
  Application

  Owns the long-lived objects a cdnctl invocation works with.
*/
struct Application {
  std::shared_ptr<db::Repository>   repository;
  std::shared_ptr<core::ConfigStore> store;
};

/*
  BuildRepository

  Opens the configured backend and brings its schema up to date.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.

  Open or migration failures raise util::StorageUnavailable.
*/
std::shared_ptr<db::Repository> BuildRepository(const cdn::runtime::config::RuntimeConfig& config);

#if CDN_DB_SQLITE
// Creates the parent directory when missing.
std::shared_ptr<db::Repository> OpenSqliteRepository(const std::string& path, bool wal_mode = true, unsigned busy_timeout_ms = 5000);
#endif

Application Build(const cdn::runtime::config::RuntimeConfig& config);

} // namespace cdn::factory
