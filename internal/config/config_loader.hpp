#pragma once

#include <string>

#include "config/config.pb.h"

namespace roadcast::config {

/*
  Loads RuntimeConfig from a YAML file or string.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  malformed durations are rejected with the protobuf field path.
*/
class ConfigLoader {
 public:
  static roadcast::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static roadcast::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace roadcast::config
