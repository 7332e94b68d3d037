#pragma once

#include <string>

#include <google/protobuf/message.h>
#include <yaml-cpp/yaml.h>

#include "config/config.pb.h"

namespace cloudstrap::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static cloudstrap::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion from an in-memory document.
  static cloudstrap::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  // Any YAML node into any message; unknown fields are rejected.
  static void YamlToMessage(const YAML::Node& yaml, google::protobuf::Message* message);
};

} // namespace cloudstrap::config
