#pragma once

#include <string>

#include "config/config.pb.h"

namespace pano::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so field names and
  types follow api/config/config.proto and unknown keys are rejected.
  Every failure throws util::InvalidArgument naming the source.
*/
class ConfigLoader {
 public:
  static pano::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static pano::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Checks values the proto types cannot express (projection names, extensions, ...).
  static void Validate(const pano::runtime::config::RuntimeConfig& config);
};

} // namespace pano::config
