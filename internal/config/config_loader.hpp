#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace presence::config {

inline constexpr std::int64_t kMinPollIntervalSeconds     = 5;
inline constexpr std::int64_t kDefaultPollIntervalSeconds = 30;
inline constexpr std::int64_t kDefaultAwayThresholdSeconds = 180;
inline constexpr std::int64_t kDefaultMaxBackoffSeconds   = 300;
inline constexpr std::uint32_t kDefaultRequestTimeoutMs   = 10000;
inline constexpr std::uint32_t kDefaultMaxDevices         = 999;
inline constexpr std::uint32_t kDefaultMaxAddresses       = 24;
inline constexpr std::uint32_t kDefaultQueryWindow        = 1000;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Defaults are applied
  and the result validated once; a bad file throws util::InvalidConfig.

  PRESENCE_APPLIANCE_PASSWORD, when set, replaces appliance.password.
*/
class ConfigLoader {
 public:
  static presence::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static presence::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& content);

  static void ApplyDefaults(presence::runtime::config::RuntimeConfig& config);
  static void Validate(const presence::runtime::config::RuntimeConfig& config);
};

} // namespace presence::config
