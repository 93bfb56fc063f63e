#pragma once

#include <string>

#include "config/config.pb.h"

namespace cdn::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf;
  unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static cdn::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // SQLite at $HOME/.cdn-manager/cdn-manager.db, warn logging, cdn_export.json.
  static cdn::runtime::config::RuntimeConfig Defaults();

  // Fills unset fields from Defaults() and applies CDN_DB_PATH.
  static void Finalize(cdn::runtime::config::RuntimeConfig& config);

  // "~/x" -> "$HOME/x"; other paths unchanged.
  static std::string ExpandHome(const std::string& path);
};

} // namespace cdn::config
