#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace proxicloud::config {

using proxicloud::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // Quoted scalars ("60", "true") stay strings.
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // Empty document: everything comes from env and defaults.
  if (yaml.IsNull() || !yaml.IsDefined()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

static RuntimeConfig Finish(RuntimeConfig config) {
  ConfigLoader::ApplyEnvironmentOverrides(config);
  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return Finish(ParseYaml(yaml));
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return Finish(ParseYaml(yaml));
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* value = std::getenv("PROXICLOUD_BIND_ADDRESS")) {
    config.mutable_server()->set_bind_address(value);
  }
  if (const char* value = std::getenv("PROXMOX_HOST")) {
    config.mutable_proxmox()->set_host(value);
  }
  if (const char* value = std::getenv("PROXMOX_NODE")) {
    config.mutable_proxmox()->set_node(value);
  }
  if (const char* value = std::getenv("PROXMOX_TOKEN_ID")) {
    config.mutable_proxmox()->set_token_id(value);
  }
  if (const char* value = std::getenv("PROXMOX_TOKEN_SECRET")) {
    config.mutable_proxmox()->set_token_secret(value);
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }
  if (config.store().path().empty()) {
    config.mutable_store()->set_path(kDefaultStorePath);
  }
  if (config.sdn().zone_type().empty()) {
    config.mutable_sdn()->set_zone_type(kDefaultZoneType);
  }
  if (config.proxmox().timeout_seconds() == 0) {
    config.mutable_proxmox()->set_timeout_seconds(kDefaultTimeout);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.proxmox().host().empty()) {
    throw std::invalid_argument("proxmox.host is required (or set PROXMOX_HOST)");
  }
  if (config.proxmox().node().empty()) {
    throw std::invalid_argument("proxmox.node is required (or set PROXMOX_NODE)");
  }
}

} // namespace proxicloud::config
