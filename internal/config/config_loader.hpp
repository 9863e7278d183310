#pragma once

#include <string>

#include "config/config.pb.h"

namespace pagereg::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Every failure surfaces as InvalidArgument(kInvalidConfig).
*/
class ConfigLoader {
 public:
  static pagereg::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static pagereg::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills defaults and checks cross-field rules.
  static void Validate(pagereg::runtime::config::RuntimeConfig& config);
};

} // namespace pagereg::config
