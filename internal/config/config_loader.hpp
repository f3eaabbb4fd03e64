#pragma once

#include <string>

#include "config/config.pb.h"

namespace modsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static modsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills endpoints, deadlines and store path left empty by the file.
  static void ApplyDefaults(modsync::runtime::config::RuntimeConfig* config);
};

} // namespace modsync::config
