#pragma once

#include <string>

#include "config/config.pb.h"

namespace keyshop::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Fields left unset get the service defaults (see ApplyDefaults).
*/
class ConfigLoader {
 public:
  static keyshop::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(keyshop::runtime::config::RuntimeConfig& config);
};

} // namespace keyshop::config
