#include "proxmox_client.hpp"

#include <curl/curl.h>
#include <google/protobuf/util/json_util.h>

#include <memory>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace proxicloud::proxmox {

using proxicloud::observability::IntField;
using proxicloud::observability::StringField;
using proxicloud::util::ProvisioningError;
using proxicloud::v1::Container;

namespace {

constexpr long   kDefaultTimeoutSeconds = 60;
constexpr size_t kErrorPreviewBytes     = 512;

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw ProvisioningError("curl_global_init failed");
    }
  });
}

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

std::string Preview(const std::string& body) {
  if (body.size() <= kErrorPreviewBytes) {
    return body;
  }
  return body.substr(0, kErrorPreviewBytes) + "...";
}

bool IsSuccess(long status) {
  return status >= 200 && status < 300;
}

const google::protobuf::Value* Field(const google::protobuf::Struct& entry, const std::string& key) {
  auto it = entry.fields().find(key);
  return it == entry.fields().end() ? nullptr : &it->second;
}

std::string StringOr(const google::protobuf::Struct& entry, const std::string& key, const std::string& fallback = {}) {
  const auto* value = Field(entry, key);
  if (value == nullptr) {
    return fallback;
  }
  if (value->kind_case() == google::protobuf::Value::kStringValue) {
    return value->string_value();
  }
  if (value->kind_case() == google::protobuf::Value::kNumberValue) {
    return std::to_string(static_cast<int64_t>(value->number_value()));
  }
  return fallback;
}

int64_t ValueToInt(const google::protobuf::Value& value, int64_t fallback) {
  if (value.kind_case() == google::protobuf::Value::kNumberValue) {
    return static_cast<int64_t>(value.number_value());
  }
  if (value.kind_case() == google::protobuf::Value::kStringValue) {
    try {
      return std::stoll(value.string_value());
    } catch (const std::exception&) {
      return fallback;
    }
  }
  return fallback;
}

int64_t IntOr(const google::protobuf::Struct& entry, const std::string& key, int64_t fallback = 0) {
  const auto* value = Field(entry, key);
  return value == nullptr ? fallback : ValueToInt(*value, fallback);
}

} // namespace

// ------------------------------------------------------------
// Reply parsing
// ------------------------------------------------------------

google::protobuf::Value ParseDataEnvelope(const std::string& body) {
  google::protobuf::Struct envelope;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body, &envelope, options);
  if (!status.ok()) {
    throw ProvisioningError("malformed Proxmox reply: " + std::string(status.message()));
  }

  const auto* data = Field(envelope, "data");
  if (data == nullptr) {
    google::protobuf::Value null_value;
    null_value.set_null_value(google::protobuf::NULL_VALUE);
    return null_value;
  }
  return *data;
}

Container ParseContainer(const google::protobuf::Struct& entry) {
  Container container;
  container.set_vmid(static_cast<int32_t>(IntOr(entry, "vmid")));
  container.set_name(StringOr(entry, "name"));
  container.set_status(StringOr(entry, "status", "unknown"));
  container.set_mem(IntOr(entry, "mem"));
  container.set_maxmem(IntOr(entry, "maxmem"));
  return container;
}

int32_t ParseNextVMID(const google::protobuf::Value& data) {
  const auto vmid = ValueToInt(data, 0);
  if (vmid <= 0) {
    throw ProvisioningError("unexpected /cluster/nextid reply");
  }
  return static_cast<int32_t>(vmid);
}

std::vector<Container> ParseContainerList(const google::protobuf::Value& data) {
  std::vector<Container> containers;
  if (data.kind_case() != google::protobuf::Value::kListValue) {
    return containers;
  }

  for (const auto& item : data.list_value().values()) {
    if (item.kind_case() != google::protobuf::Value::kStructValue) {
      continue;
    }
    auto container = ParseContainer(item.struct_value());
    if (container.vmid() > 0) {
      containers.push_back(std::move(container));
    }
  }
  return containers;
}

// ------------------------------------------------------------
// Transport
// ------------------------------------------------------------

std::string ProxmoxClient::BuildBaseUrl(const std::string& host) {
  std::string trimmed = host;
  while (!trimmed.empty() && trimmed.back() == '/') {
    trimmed.pop_back();
  }

  if (trimmed.rfind("http://", 0) == 0 || trimmed.rfind("https://", 0) == 0) {
    return trimmed + "/api2/json";
  }
  return "https://" + trimmed + ":8006/api2/json";
}

ProxmoxClient::ProxmoxClient(const proxicloud::runtime::config::ProxmoxConfig& config)
    : base_url_(BuildBaseUrl(config.host())),
      node_(config.node()),
      auth_header_("Authorization: PVEAPIToken=" + config.token_id() + "=" + config.token_secret()),
      insecure_(config.insecure()),
      timeout_seconds_(config.timeout_seconds() > 0 ? static_cast<long>(config.timeout_seconds()) : kDefaultTimeoutSeconds) {
  EnsureCurlInitialized();
}

std::string ProxmoxClient::EncodeForm(const FormFields& form) const {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    throw ProvisioningError("failed to initialise curl");
  }

  std::string encoded;
  for (const auto& [key, value] : form) {
    std::unique_ptr<char, decltype(&curl_free)> k(curl_easy_escape(curl.get(), key.c_str(), static_cast<int>(key.size())), curl_free);
    std::unique_ptr<char, decltype(&curl_free)> v(curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size())), curl_free);
    if (!k || !v) {
      throw ProvisioningError("failed to encode form field " + key);
    }

    if (!encoded.empty()) {
      encoded += '&';
    }
    encoded += k.get();
    encoded += '=';
    encoded += v.get();
  }
  return encoded;
}

ProxmoxClient::Response ProxmoxClient::Perform(const std::string& method, const std::string& path, const FormFields& form) const {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    throw ProvisioningError("failed to initialise curl");
  }

  const std::string url  = base_url_ + path;
  const std::string body = EncodeForm(form);

  struct curl_slist* raw_headers = nullptr;
  raw_headers                    = curl_slist_append(raw_headers, auth_header_.c_str());
  if (!body.empty()) {
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/x-www-form-urlencoded");
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers, curl_slist_free_all);

  Response response;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  if (method == "POST" || method == "PUT") {
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  }

  if (insecure_) {
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
  }

  PROXICLOUD_LOG_DEBUG("Proxmox request", {StringField("method", method), StringField("path", path)});

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw ProvisioningError(method + " " + path + " failed: " + curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

  PROXICLOUD_LOG_DEBUG("Proxmox response", {StringField("path", path), IntField("status", response.status),
                                            IntField("bytes", static_cast<int64_t>(response.body.size()))});
  return response;
}

google::protobuf::Value ProxmoxClient::Call(const std::string& method, const std::string& path, const FormFields& form) const {
  auto response = Perform(method, path, form);
  if (!IsSuccess(response.status)) {
    throw ProvisioningError("proxmox API error (status " + std::to_string(response.status) + ") on " + method + " " + path + ": " +
                            Preview(response.body));
  }
  return ParseDataEnvelope(response.body);
}

// ------------------------------------------------------------
// SDN
// ------------------------------------------------------------

void ProxmoxClient::CreateZone(const std::string& zone, const std::string& type, const ZoneOptions& options, bool dhcp_enabled) {
  FormFields form = {{"zone", zone}, {"type", type}};
  for (const auto& [key, value] : options) {
    form.emplace_back(key, value);
  }
  if (dhcp_enabled) {
    form.emplace_back("dhcp", "dnsmasq");
    form.emplace_back("ipam", "pve");
  }

  Call("POST", "/cluster/sdn/zones", form);
  PROXICLOUD_LOG_INFO("Created SDN zone", {StringField("zone", zone), StringField("type", type)});
}

void ProxmoxClient::CreateVNet(const std::string& vnet, const std::string& zone, int32_t vlan_tag) {
  FormFields form = {{"vnet", vnet}, {"zone", zone}};
  if (vlan_tag > 0) {
    form.emplace_back("tag", std::to_string(vlan_tag));
  }

  Call("POST", "/cluster/sdn/vnets", form);
  PROXICLOUD_LOG_INFO("Created SDN vnet", {StringField("vnet", vnet), StringField("zone", zone), IntField("tag", vlan_tag)});
}

void ProxmoxClient::CreateSubnet(const std::string& vnet, const std::string& cidr, const std::string& gateway, bool snat,
                                 const std::string& dhcp_range) {
  FormFields form = {{"type", "subnet"}, {"subnet", cidr}};
  if (!gateway.empty()) {
    form.emplace_back("gateway", gateway);
  }
  if (snat) {
    form.emplace_back("snat", "1");
  }
  if (!dhcp_range.empty()) {
    form.emplace_back("dhcp-range", dhcp_range);
  }

  Call("POST", "/cluster/sdn/vnets/" + vnet + "/subnets", form);
  PROXICLOUD_LOG_INFO("Created SDN subnet", {StringField("vnet", vnet), StringField("subnet", cidr), StringField("gateway", gateway)});
}

/*
  Subnet IDs are assigned by Proxmox ("<zone>-<net>-<mask>"), so the entry is
  looked up by its cidr first.
*/
void ProxmoxClient::DeleteSubnet(const std::string& vnet, const std::string& cidr) {
  const auto path = "/cluster/sdn/vnets/" + vnet + "/subnets";
  const auto data = Call("GET", path);

  std::string subnet_id;
  if (data.kind_case() == google::protobuf::Value::kListValue) {
    for (const auto& item : data.list_value().values()) {
      if (item.kind_case() != google::protobuf::Value::kStructValue) {
        continue;
      }
      const auto& entry = item.struct_value();
      if (StringOr(entry, "cidr") == cidr) {
        subnet_id = StringOr(entry, "subnet");
        if (subnet_id.empty()) {
          subnet_id = StringOr(entry, "id");
        }
        break;
      }
    }
  }

  if (subnet_id.empty()) {
    throw ProvisioningError("subnet " + cidr + " not found in vnet " + vnet);
  }

  Call("DELETE", path + "/" + subnet_id);
  PROXICLOUD_LOG_INFO("Deleted SDN subnet", {StringField("vnet", vnet), StringField("subnet", cidr)});
}

void ProxmoxClient::DeleteVNet(const std::string& vnet) {
  Call("DELETE", "/cluster/sdn/vnets/" + vnet);
  PROXICLOUD_LOG_INFO("Deleted SDN vnet", {StringField("vnet", vnet)});
}

void ProxmoxClient::DeleteZone(const std::string& zone) {
  Call("DELETE", "/cluster/sdn/zones/" + zone);
  PROXICLOUD_LOG_INFO("Deleted SDN zone", {StringField("zone", zone)});
}

void ProxmoxClient::ApplyConfig() {
  Call("PUT", "/cluster/sdn");
  PROXICLOUD_LOG_INFO("Applied SDN configuration");
}

// ------------------------------------------------------------
// Containers
// ------------------------------------------------------------

std::vector<Container> ProxmoxClient::ListContainers() {
  return ParseContainerList(Call("GET", "/nodes/" + node_ + "/lxc"));
}

int32_t ProxmoxClient::NextVMID() {
  return ParseNextVMID(Call("GET", "/cluster/nextid"));
}

std::optional<Container> ProxmoxClient::GetContainer(int32_t vmid) {
  const auto path     = "/nodes/" + node_ + "/lxc/" + std::to_string(vmid) + "/status/current";
  auto       response = Perform("GET", path, {});

  if (response.status == 404 || (response.status == 500 && response.body.find("does not exist") != std::string::npos)) {
    return std::nullopt;
  }
  if (!IsSuccess(response.status)) {
    throw ProvisioningError("proxmox API error (status " + std::to_string(response.status) + ") on GET " + path + ": " +
                            Preview(response.body));
  }

  const auto data = ParseDataEnvelope(response.body);
  if (data.kind_case() != google::protobuf::Value::kStructValue) {
    return std::nullopt;
  }

  auto container = ParseContainer(data.struct_value());
  container.set_vmid(vmid);
  return container;
}

} // namespace proxicloud::proxmox
