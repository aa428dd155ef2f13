#pragma once

#include <string>

#include "config/config.pb.h"

namespace archstore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset sections are
  filled by ApplyDefaults so callers never see zero intervals or limits.
*/
class ConfigLoader {
 public:
  static archstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(archstore::runtime::config::RuntimeConfig& config);

  // Fully defaulted config for the given store file.
  static archstore::runtime::config::RuntimeConfig Defaults(const std::string& store_path);
};

} // namespace archstore::config
