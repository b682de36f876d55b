#pragma once

#include <string>

#include "config/config.pb.h"

namespace outbox::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static outbox::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static outbox::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace outbox::config
