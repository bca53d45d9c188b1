#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "proxicloud/v1.hpp"

using namespace proxicloud::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  projectctl <addr> list\n"
            << "  projectctl <addr> get <project_id>\n"
            << "  projectctl <addr> create <name> [key=value...]\n"
            << "  projectctl <addr> update <project_id> [key=value...]\n"
            << "  projectctl <addr> delete <project_id>\n"
            << "  projectctl <addr> containers <project_id>\n"
            << "  projectctl <addr> assign <vmid> [project_id]\n"
            << "  projectctl <addr> reserve <project_id> [vmid]\n"
            << "\n"
            << "  keys: name description tags=a,b subnet gateway nameserver vlan range=<start>-<end>\n";
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to format response: " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static std::map<std::string, std::string> ParseOptions(int argc, char** argv, int first) {
  std::map<std::string, std::string> options;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      std::cerr << "expected key=value, got '" << arg << "'\n";
      std::exit(1);
    }
    options[arg.substr(0, eq)] = arg.substr(eq + 1);
  }
  return options;
}

static int32_t ParseInt(const std::string& value, const char* what) {
  try {
    return static_cast<int32_t>(std::stol(value));
  } catch (const std::exception&) {
    std::cerr << "invalid " << what << ": " << value << "\n";
    std::exit(1);
  }
}

static void SplitTags(const std::string& value, google::protobuf::RepeatedPtrField<std::string>* tags) {
  size_t start = 0;
  while (start <= value.size()) {
    auto comma = value.find(',', start);
    if (comma == std::string::npos) comma = value.size();
    if (comma > start) {
      *tags->Add() = value.substr(start, comma - start);
    }
    start = comma + 1;
  }
}

static std::pair<int32_t, int32_t> ParseRange(const std::string& value) {
  auto dash = value.find('-');
  if (dash == std::string::npos) {
    std::cerr << "invalid range (want <start>-<end>): " << value << "\n";
    std::exit(1);
  }
  return {ParseInt(value.substr(0, dash), "range start"), ParseInt(value.substr(dash + 1), "range end")};
}

// Fields shared by create and update.
template <typename Request>
static void ApplyNetworkAndRange(const std::map<std::string, std::string>& options, Request* req) {
  for (const auto& [key, value] : options) {
    if (key == "subnet") {
      req->mutable_network()->set_subnet(value);
    } else if (key == "gateway") {
      req->mutable_network()->set_gateway(value);
    } else if (key == "nameserver") {
      req->mutable_network()->set_nameserver(value);
    } else if (key == "vlan") {
      req->mutable_network()->set_vlan_tag(ParseInt(value, "vlan"));
    } else if (key == "range") {
      auto [start, end] = ParseRange(value);
      req->set_container_id_start(start);
      req->set_container_id_end(end);
    }
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ProjectService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListProjectsResponse resp;
    auto                 status = stub->ListProjects(&ctx, ListProjectsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& project : resp.projects()) {
      std::cout << project.id() << "  " << project.name();
      if (project.has_network() && !project.network().subnet().empty()) {
        std::cout << "  " << project.network().subnet() << " via " << project.network().vnet_id();
      }
      if (project.has_container_id_start()) {
        std::cout << "  ids " << project.container_id_start() << "-" << project.container_id_end();
      }
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetProjectRequest req;
    req.set_id(argv[3]);

    GetProjectResponse resp;
    auto               status = stub->GetProject(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.project());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 4) return 1;

    CreateProjectRequest req;
    req.set_name(argv[3]);

    const auto options = ParseOptions(argc, argv, 4);
    if (auto it = options.find("description"); it != options.end()) req.set_description(it->second);
    if (auto it = options.find("tags"); it != options.end()) SplitTags(it->second, req.mutable_tags());
    ApplyNetworkAndRange(options, &req);

    CreateProjectResponse resp;
    auto                  status = stub->CreateProject(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.project());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "update") {
    if (argc < 4) return 1;

    UpdateProjectRequest req;
    req.set_id(argv[3]);

    const auto options = ParseOptions(argc, argv, 4);
    if (auto it = options.find("name"); it != options.end()) req.set_name(it->second);
    if (auto it = options.find("description"); it != options.end()) req.set_description(it->second);
    if (auto it = options.find("tags"); it != options.end()) SplitTags(it->second, req.mutable_tags()->mutable_values());
    ApplyNetworkAndRange(options, &req);

    UpdateProjectResponse resp;
    auto                  status = stub->UpdateProject(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.project());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteProjectRequest req;
    req.set_id(argv[3]);

    google::protobuf::Empty resp;
    auto                    status = stub->DeleteProject(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "containers") {
    if (argc < 4) return 1;

    GetProjectContainersRequest req;
    req.set_id(argv[3]);

    GetProjectContainersResponse resp;
    auto                         status = stub->GetProjectContainers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& container : resp.containers()) {
      std::cout << container.vmid() << "  " << container.name() << "  " << container.status() << "\n";
    }
    const auto& agg = resp.aggregate();
    std::cout << "total=" << agg.total_containers() << " running=" << agg.running() << " stopped=" << agg.stopped()
              << " memory_mb=" << agg.used_memory_mb() << "/" << agg.total_memory_mb() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "assign") {
    if (argc < 4) return 1;

    AssignContainerRequest req;
    req.set_vmid(ParseInt(argv[3], "vmid"));
    if (argc >= 5) req.set_project_id(argv[4]);

    google::protobuf::Empty resp;
    auto                    status = stub->AssignContainer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (req.project_id().empty() ? "unassigned\n" : "assigned\n");
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reserve") {
    if (argc < 4) return 1;

    ReserveContainerIDRequest req;
    req.set_project_id(argv[3]);
    if (argc >= 5) req.set_vmid(ParseInt(argv[4], "vmid"));

    ReserveContainerIDResponse resp;
    auto                       status = stub->ReserveContainerID(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "vmid=" << resp.vmid();
    if (!resp.vnet_id().empty()) {
      std::cout << " vnet=" << resp.vnet_id() << " gateway=" << resp.gateway() << " nameserver=" << resp.nameserver();
    }
    std::cout << "\n";
    return 0;
  }

  Usage();
  return 1;
}
