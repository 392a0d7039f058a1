#pragma once

#include <string>

#include "config/config.pb.h"

namespace upload::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  type mismatches are rejected by the protobuf parser. Plain scalars other
  than true/false/null are handed over as JSON strings; the protobuf JSON
  parser accepts strings for numeric fields, which keeps numeric-looking
  tenant ids and 64-bit sizes intact.

  Every loaded config passes Validate(); errors name the offending field.
*/
class ConfigLoader {
 public:
  static upload::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static upload::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::runtime_error on the first violation.
  static void Validate(const upload::runtime::config::RuntimeConfig& config);
};

} // namespace upload::config
