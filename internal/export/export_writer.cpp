#include "export_writer.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/type_resolver.h>
#include <google/protobuf/util/type_resolver_util.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cdn::exporter {

using cdn::observability::IntField;
using cdn::observability::StringField;

namespace {

constexpr char kTypeUrlPrefix[] = "type.googleapis.com";

// int64 columns; canonical proto JSON quotes them.
constexpr const char* kIntegerFields[] = {"id", "origin_id", "cache_ttl", "ttl"};

void UnquoteIntegers(google::protobuf::Struct* object) {
  auto& fields = *object->mutable_fields();
  for (const char* name : kIntegerFields) {
    auto it = fields.find(name);
    if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) continue;
    const auto number = std::stoll(it->second.string_value());
    it->second.set_number_value(static_cast<double>(number));
  }
}

void NormalizeRows(google::protobuf::Struct* root, const std::string& key, const char* nullable_field) {
  auto& fields = *root->mutable_fields();
  auto  it     = fields.find(key);
  if (it == fields.end() || !it->second.has_list_value()) return;

  for (auto& row : *it->second.mutable_list_value()->mutable_values()) {
    if (!row.has_struct_value()) continue;
    auto* object = row.mutable_struct_value();
    UnquoteIntegers(object);
    if (nullable_field != nullptr && !object->fields().contains(nullable_field)) {
      (*object->mutable_fields())[nullable_field].set_null_value(google::protobuf::NULL_VALUE);
    }
  }
}

std::string PrintValue(const google::protobuf::Value& value, const google::protobuf::util::JsonPrintOptions& options) {
  std::string binary;
  {
    google::protobuf::io::StringOutputStream raw(&binary);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    // sorted object keys
    coded.SetSerializationDeterministic(true);
    if (!value.SerializeToCodedStream(&coded)) {
      throw std::runtime_error("Failed to serialize export document");
    }
  }

  std::unique_ptr<google::protobuf::util::TypeResolver> resolver(
      google::protobuf::util::NewTypeResolverForDescriptorPool(kTypeUrlPrefix,
                                                               google::protobuf::DescriptorPool::generated_pool()));

  std::string json;
  auto        status = google::protobuf::util::BinaryToJsonString(
      resolver.get(), std::string(kTypeUrlPrefix) + "/" + value.GetDescriptor()->full_name(), binary, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize export document: " + std::string(status.message()));
  }
  return json;
}

} // namespace

std::string ToJson(const cdn::manager::v1::ExportDocument& document) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string canonical;
  auto        status = google::protobuf::util::MessageToJsonString(document, &canonical, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize export document: " + std::string(status.message()));
  }

  google::protobuf::Value tree;
  status = google::protobuf::util::JsonStringToMessage(canonical, &tree);
  if (!status.ok() || !tree.has_struct_value()) {
    throw std::runtime_error("Failed to reshape export document: " + std::string(status.message()));
  }

  auto* root = tree.mutable_struct_value();
  NormalizeRows(root, "origins", "last_purge");
  NormalizeRows(root, "cache_rules", nullptr);
  NormalizeRows(root, "recent_purge_events", nullptr);

  google::protobuf::util::JsonPrintOptions pretty;
  pretty.add_whitespace = true;
  return PrintValue(tree, pretty);
}

std::string WriteExport(const cdn::manager::v1::ExportDocument& document, const std::string& path) {
  const auto json     = ToJson(document);
  const auto tmp_path = path + ".tmp";

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::StorageUnavailable("cannot open " + tmp_path + " for writing");
    }

    out << json;
    out.flush();
    if (!out) {
      out.close();
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw util::StorageUnavailable("failed writing " + tmp_path);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw util::StorageUnavailable("cannot move export into " + path + ": " + ec.message());
  }

  CDN_LOG_INFO("Export written", {StringField("path", path), IntField("origins", document.origins_size()),
                                  IntField("cache_rules", document.cache_rules_size()),
                                  IntField("purge_events", document.recent_purge_events_size())});
  return path;
}

} // namespace cdn::exporter
