#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"

namespace streak::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields and out-of-range values are rejected.
*/
class ConfigLoader {
 public:
  static streak::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::invalid_argument on values the engine cannot run with.
  static void Validate(const streak::runtime::config::RuntimeConfig& config);
};

// Unset duration -> fallback.
std::chrono::milliseconds DurationOr(const google::protobuf::Duration& duration, bool is_set,
                                     std::chrono::milliseconds fallback);

} // namespace streak::config
