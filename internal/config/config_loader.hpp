#pragma once

#include <string>

#include "config/config.pb.h"

namespace bay::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Defaults are filled in after parsing, then the result is
  validated. Every error is a std::runtime_error naming the offending key.
*/
class ConfigLoader {
 public:
  static bay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config with every default applied, used when no file is found.
  static bay::runtime::config::RuntimeConfig Defaults();

  /*
    Config file lookup: explicit path, then BAY_CONFIG_FILE, then
    ./config.yaml, then /etc/bay/config.yaml. Empty when none exists.
  */
  static std::string ResolvePath(const std::string& explicit_path);

  static void ApplyDefaults(bay::runtime::config::RuntimeConfig& config);
  static void Validate(const bay::runtime::config::RuntimeConfig& config);
};

} // namespace bay::config
