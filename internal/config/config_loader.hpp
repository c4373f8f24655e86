#pragma once

#include <string>

#include "config/config.pb.h"

namespace doccat::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing namespace names fall back to SYSCAT / DOCDATA / DOCCAT.
*/
class ConfigLoader {
 public:
  static doccat::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static doccat::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // Fills defaults and throws std::runtime_error on an unusable config.
  static void Normalize(doccat::runtime::config::RuntimeConfig& config);
};

} // namespace doccat::config
