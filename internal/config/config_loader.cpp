#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "cdn/manager/v1.hpp"

namespace cdn::config {

namespace {

constexpr const char* kDefaultDbPath        = "~/.cdn-manager/cdn-manager.db";
constexpr unsigned    kDefaultBusyTimeoutMs = 5000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

cdn::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  cdn::runtime::config::RuntimeConfig config;

  // an empty document is a valid, all-defaults config
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

cdn::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  cdn::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");

  auto* sqlite = config.mutable_database()->mutable_sqlite();
  sqlite->set_path(kDefaultDbPath);
  sqlite->set_wal_mode(true);
  sqlite->set_busy_timeout_ms(kDefaultBusyTimeoutMs);

  config.mutable_export_()->set_default_path(cdn::manager::v1::kDefaultExportPath);
  config.mutable_export_()->set_recent_purge_limit(cdn::manager::v1::kDefaultRecentPurgeLimit);
  return config;
}

void ConfigLoader::Finalize(cdn::runtime::config::RuntimeConfig& config) {
  const auto defaults = Defaults();

  if (config.logging().level().empty()) {
    config.mutable_logging()->set_level(defaults.logging().level());
  }

  if (config.database().backend_case() == cdn::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    *config.mutable_database() = defaults.database();
  }

  if (config.database().has_sqlite()) {
    auto* sqlite = config.mutable_database()->mutable_sqlite();
    if (const char* env_path = std::getenv("CDN_DB_PATH"); env_path && *env_path) {
      sqlite->set_path(env_path);
    }
    if (sqlite->path().empty()) {
      sqlite->set_path(kDefaultDbPath);
    }
    if (!sqlite->has_wal_mode()) {
      sqlite->set_wal_mode(true);
    }
    if (sqlite->busy_timeout_ms() == 0) {
      sqlite->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
    }
    sqlite->set_path(ExpandHome(sqlite->path()));
  }

  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
  }

  if (config.export_().default_path().empty()) {
    config.mutable_export_()->set_default_path(defaults.export_().default_path());
  }
  if (config.export_().recent_purge_limit() == 0) {
    config.mutable_export_()->set_recent_purge_limit(defaults.export_().recent_purge_limit());
  }
}

std::string ConfigLoader::ExpandHome(const std::string& path) {
  if (path.rfind("~/", 0) != 0) {
    return path;
  }
  const char* home = std::getenv("HOME");
  if (!home || !*home) {
    throw std::runtime_error("cannot expand '" + path + "': HOME is not set");
  }
  return std::string(home) + path.substr(1);
}

} // namespace cdn::config
