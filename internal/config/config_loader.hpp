#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace proxicloud::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf (unknown keys are
  rejected). Afterwards environment overrides are applied, defaults filled in
  and the result validated:

    PROXICLOUD_BIND_ADDRESS   server.bind_address
    PROXMOX_HOST              proxmox.host
    PROXMOX_NODE              proxmox.node
    PROXMOX_TOKEN_ID          proxmox.token_id
    PROXMOX_TOKEN_SECRET      proxmox.token_secret
*/
class ConfigLoader {
 public:
  static constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";
  static constexpr const char* kDefaultStorePath   = "/var/lib/proxicloud/projects.json";
  static constexpr const char* kDefaultZoneType    = "simple";
  static constexpr uint32_t    kDefaultTimeout     = 60;

  static proxicloud::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static proxicloud::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyEnvironmentOverrides(proxicloud::runtime::config::RuntimeConfig& config);
  static void ApplyDefaults(proxicloud::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument naming the first missing setting.
  static void Validate(const proxicloud::runtime::config::RuntimeConfig& config);
};

} // namespace proxicloud::config
