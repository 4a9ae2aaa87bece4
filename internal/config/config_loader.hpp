#pragma once

#include <string>

#include "config/config.pb.h"

namespace YAML {
class Node;
}

namespace jobq::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static jobq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for an in-memory YAML document.
  static jobq::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

 private:
  static jobq::runtime::config::RuntimeConfig FromNode(const YAML::Node& yaml);
};

} // namespace jobq::config
