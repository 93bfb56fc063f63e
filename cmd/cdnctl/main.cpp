#include <iostream>
#include <string>
#include <vector>

#include "internal/cli/commands.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using cdn::config::ConfigLoader;

static cdn::runtime::config::RuntimeConfig ResolveConfig(const cdn::cli::GlobalOptions& options) {
  auto config = options.config_path ? ConfigLoader::LoadFromYaml(*options.config_path) : ConfigLoader::Defaults();
  ConfigLoader::Finalize(config);

  // command line wins over file and CDN_DB_PATH
  if (options.db_path) {
    if (!config.database().has_sqlite()) {
      *config.mutable_database() = ConfigLoader::Defaults().database();
    }
    config.mutable_database()->mutable_sqlite()->set_path(ConfigLoader::ExpandHome(*options.db_path));
  } else if (options.memory) {
    config.mutable_database()->mutable_memory();
  }
  return config;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  cdn::cli::GlobalOptions options;
  try {
    options = cdn::cli::ParseGlobalOptions(args);
  } catch (const cdn::cli::UsageError& e) {
    std::cerr << "error: " << e.what() << "\n";
    cdn::cli::PrintUsage(std::cerr);
    return cdn::cli::kExitUsage;
  }

  if (options.help) {
    cdn::cli::PrintUsage(std::cout);
    return cdn::cli::kExitOk;
  }
  if (options.command.empty()) {
    cdn::cli::PrintUsage(std::cerr);
    return cdn::cli::kExitUsage;
  }

  // stderr logger before the config file is read; re-applied below
  cdn::observability::InitializeLogging(ConfigLoader::Defaults());

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ResolveConfig(options);

    cdn::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Open the store
    // ------------------------------------------------------------
    auto app = cdn::factory::Build(config);

    cdn::cli::Context ctx{std::cout, std::cerr, cdn::cli::ResolveColor(options.color), config.export_().default_path()};
    int               rc = cdn::cli::Execute(*app.store, options.command, ctx);

    cdn::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    CDN_LOG_ERROR("Fatal error", {cdn::observability::StringField("error", e.what())});
    std::cerr << "error: " << e.what() << "\n";
    cdn::observability::ShutdownLogging();
    return cdn::cli::kExitStoreError;
  }
}
