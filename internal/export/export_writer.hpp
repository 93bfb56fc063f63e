#pragma once

#include <string>

#include "cdn/manager/v1.hpp"

namespace cdn::exporter {

/*
  Indented JSON with field names as declared in types.proto.
  Integer columns print as numbers and a never-purged origin
  carries "last_purge": null. Object keys are sorted.
*/
std::string ToJson(const cdn::manager::v1::ExportDocument& document);

/*
  Atomic write:
      tmp file → flush → rename

  Returns path. Any I/O failure raises util::StorageUnavailable
  and leaves a previous file at path untouched.
*/
std::string WriteExport(const cdn::manager::v1::ExportDocument& document, const std::string& path);

} // namespace cdn::exporter
