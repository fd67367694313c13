#pragma once

#include <string>

#include "config/config.pb.h"

namespace booking::config {

/*
  Loads RuntimeConfig from a YAML file or string.

  YAML is converted to a google.protobuf.Value, serialized to JSON and
  parsed into the message. Unknown fields are rejected. Built-in defaults
  are applied to every field left unset.
*/
class ConfigLoader {
 public:
  static booking::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static booking::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  // Fills defaults and rejects out-of-range values.
  static void Normalize(booking::runtime::config::RuntimeConfig& config);
};

} // namespace booking::config
