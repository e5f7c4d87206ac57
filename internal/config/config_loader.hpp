#pragma once

#include <string>

#include "config/config.pb.h"

namespace market::config {

inline constexpr const char* kDefaultContractPrincipal = "market.escrow";
inline constexpr const char* kDefaultBindAddress       = "0.0.0.0:50061";

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown fields
  are rejected. The result has defaults applied and is validated.
*/
class ConfigLoader {
 public:
  static market::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static market::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::runtime_error("Invalid configuration: ...").
  static void Validate(const market::runtime::config::RuntimeConfig& config);

  static void ApplyDefaults(market::runtime::config::RuntimeConfig* config);
};

} // namespace market::config
