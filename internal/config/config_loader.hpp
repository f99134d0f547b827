#pragma once

#include <string>

#include "config/config.pb.h"

namespace trackq::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Defaults are filled in
  for unset fields and the result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static trackq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

// Fills unset fields with their defaults.
void ApplyDefaults(trackq::runtime::config::RuntimeConfig& config);

// Throws std::runtime_error describing the first invalid field.
void Validate(const trackq::runtime::config::RuntimeConfig& config);

} // namespace trackq::config
