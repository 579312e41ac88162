#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/core/cascade_options.hpp"

namespace cascade::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static cascade::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static cascade::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

/*
  Applies defaults to the delete_operations section.
  Throws std::invalid_argument on out-of-range values.
*/
cascade::core::CascadeOptions BuildCascadeOptions(const cascade::runtime::config::RuntimeConfig& config);

} // namespace cascade::config
