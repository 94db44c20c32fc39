#pragma once

#include <string>

#include "config/config.pb.h"

namespace cpandb::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so the schema in
  api/config/config.proto is the single source of truth for field names.
*/
class ConfigLoader {
 public:
  static cpandb::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills zero-valued fields with the generator defaults.
  static void ApplyDefaults(cpandb::runtime::config::RuntimeConfig& config);
};

} // namespace cpandb::config
