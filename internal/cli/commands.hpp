#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cdn/manager/v1.hpp"

namespace cdn::core {
class ConfigStore;
}

namespace cdn::cli {

// Malformed command line; cdnctl exits with kExitUsage.
class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

inline constexpr int kExitOk         = 0;
inline constexpr int kExitStoreError = 1;
inline constexpr int kExitUsage      = 2;

struct GlobalOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> db_path;
  bool                       memory = false;
  bool                       color  = true;
  bool                       help   = false;

  // command name followed by its arguments
  std::vector<std::string> command;
};

// Consumes the options that precede the command name.
GlobalOptions ParseGlobalOptions(const std::vector<std::string>& args);

// false when --no-color was given or NO_COLOR is set
bool ResolveColor(bool requested);

void PrintUsage(std::ostream& out);

struct Context {
  std::ostream& out;
  std::ostream& err;
  bool          color               = true;
  std::string   default_export_path = cdn::manager::v1::kDefaultExportPath;
};

/*
  Runs one command against store.

  Returns kExitOk, kExitUsage for malformed arguments, or
  kExitStoreError when the store rejects the operation. Errors
  are written to ctx.err as "error: <message>".
*/
int Execute(core::ConfigStore& store, const std::vector<std::string>& command, const Context& ctx);

} // namespace cdn::cli
