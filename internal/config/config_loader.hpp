#pragma once

#include <string>

#include "config/config.pb.h"

namespace offline::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Sections left out of the file are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static offline::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace offline::config
