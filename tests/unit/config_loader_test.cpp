#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using proxicloud::config::ConfigLoader;

constexpr const char* kOverrideVars[] = {"PROXICLOUD_BIND_ADDRESS", "PROXMOX_HOST", "PROXMOX_NODE", "PROXMOX_TOKEN_ID",
                                         "PROXMOX_TOKEN_SECRET"};

void ClearOverrides() {
  for (const char* name : kOverrideVars) {
    unsetenv(name);
  }
}

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "proxicloud_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  ClearOverrides();

  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
proxmox:
  host: "https://pve.lab:8006"
  node: pve1
  token_id: "root@pam!proxicloud"
  token_secret: "s3cr3t"
  insecure: true
  timeout_seconds: 15
store:
  path: /tmp/proxicloud/projects.json
sdn:
  zone_type: vlan
logging:
  level: debug
  include_trace_context: false
observability:
  tracing_enabled: false
  metrics_enabled: true
  otlp_endpoint: "localhost:4317"
  transport: OTLP_TRANSPORT_GRPC
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.proxmox().host() == "https://pve.lab:8006");
  assert(config.proxmox().node() == "pve1");
  assert(config.proxmox().token_id() == "root@pam!proxicloud");
  assert(config.proxmox().token_secret() == "s3cr3t");
  assert(config.proxmox().insecure());
  assert(config.proxmox().timeout_seconds() == 15);
  assert(config.store().path() == "/tmp/proxicloud/projects.json");
  assert(config.sdn().zone_type() == "vlan");
  assert(config.logging().level() == "debug");
  assert(config.observability().metrics_enabled());
  assert(config.observability().transport() == proxicloud::runtime::config::OTLP_TRANSPORT_GRPC);
}

void TestDefaultsFillMissingSettings() {
  ClearOverrides();

  auto config = ConfigLoader::LoadFromYamlString(R"(proxmox:
  host: pve.lab
  node: pve1
)");

  assert(config.server().bind_address() == ConfigLoader::kDefaultBindAddress);
  assert(config.store().path() == ConfigLoader::kDefaultStorePath);
  assert(config.sdn().zone_type() == ConfigLoader::kDefaultZoneType);
  assert(config.proxmox().timeout_seconds() == ConfigLoader::kDefaultTimeout);
  assert(!config.proxmox().insecure());
}

void TestEnvironmentOverridesFile() {
  ClearOverrides();
  setenv("PROXMOX_HOST", "10.0.0.2", 1);
  setenv("PROXMOX_TOKEN_SECRET", "from-env", 1);
  setenv("PROXICLOUD_BIND_ADDRESS", "0.0.0.0:7000", 1);

  auto config = ConfigLoader::LoadFromYamlString(R"(proxmox:
  host: pve.lab
  node: pve1
  token_secret: from-file
)");

  assert(config.proxmox().host() == "10.0.0.2");
  assert(config.proxmox().node() == "pve1");
  assert(config.proxmox().token_secret() == "from-env");
  assert(config.server().bind_address() == "0.0.0.0:7000");

  ClearOverrides();
}

void TestEnvironmentAloneIsEnough() {
  ClearOverrides();
  setenv("PROXMOX_HOST", "pve.env", 1);
  setenv("PROXMOX_NODE", "node-env", 1);
  setenv("PROXMOX_TOKEN_ID", "api@pve!ci", 1);

  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.proxmox().host() == "pve.env");
  assert(config.proxmox().node() == "node-env");
  assert(config.proxmox().token_id() == "api@pve!ci");
  assert(config.store().path() == ConfigLoader::kDefaultStorePath);

  ClearOverrides();
}

void TestMissingHostOrNodeIsRejected() {
  ClearOverrides();

  assert(Throws<std::invalid_argument>([] { ConfigLoader::LoadFromYamlString("proxmox:\n  node: pve1\n"); }));
  assert(Throws<std::invalid_argument>([] { ConfigLoader::LoadFromYamlString("proxmox:\n  host: pve.lab\n"); }));
  assert(Throws<std::invalid_argument>([] { ConfigLoader::LoadFromYamlString("store:\n  path: /tmp/x.json\n"); }));
}

void TestUnknownFieldsAreRejected() {
  ClearOverrides();

  assert(Throws<std::runtime_error>([] {
    ConfigLoader::LoadFromYamlString(R"(proxmox:
  host: pve.lab
  node: pve1
  password: hunter2
)");
  }));

  assert(Throws<std::runtime_error>([] {
    ConfigLoader::LoadFromYamlString(R"(proxmox:
  host: pve.lab
  node: pve1
cluster: true
)");
  }));
}

void TestQuotedScalarsStayStrings() {
  ClearOverrides();

  // An unquoted numeric secret would be coerced to a number and rejected.
  auto config = ConfigLoader::LoadFromYamlString(R"(proxmox:
  host: pve.lab
  node: "12"
  token_secret: "0042"
)");
  assert(config.proxmox().node() == "12");
  assert(config.proxmox().token_secret() == "0042");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  ClearOverrides();

  auto config = ConfigLoader::LoadFromYamlString(R"(proxmox:
  host: pve.lab
  node: pve1
store:
  path: "C:\\proxicloud\\\"quoted\"\\projects.json"
)");
  assert(config.store().path() == "C:\\proxicloud\\\"quoted\"\\projects.json");
}

void TestMalformedInput() {
  ClearOverrides();

  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYaml("/nonexistent/proxicloud.yaml"); }));
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYamlString("- just\n- a list\n"); }));
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYamlString("proxmox: [unclosed\n"); }));
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsFillMissingSettings();
  TestEnvironmentOverridesFile();
  TestEnvironmentAloneIsEnough();
  TestMissingHostOrNodeIsRejected();
  TestUnknownFieldsAreRejected();
  TestQuotedScalarsStayStrings();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestMalformedInput();

  std::cout << "proxicloud_unit_config_loader: pass\n";
  return 0;
}
