#include "project_store.hpp"

#include <fcntl.h>
#include <google/protobuf/util/json_util.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/random_id.hpp"
#include "internal/util/time.hpp"

namespace proxicloud::project {

using namespace proxicloud::v1;
using proxicloud::observability::IntField;
using proxicloud::observability::StringField;
using proxicloud::util::Conflict;
using proxicloud::util::NotFound;
using proxicloud::util::PersistenceError;
using proxicloud::util::ValidationError;

namespace {

std::string ErrnoMessage() {
  return std::strerror(errno);
}

// Writes data to path and fsyncs it before closing.
void WriteFileDurably(const std::filesystem::path& path, const std::string& data) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw PersistenceError("failed to open " + path.string() + ": " + ErrnoMessage());
  }

  size_t written = 0;
  while (written < data.size()) {
    const auto n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const auto message = ErrnoMessage();
      ::close(fd);
      throw PersistenceError("failed to write " + path.string() + ": " + message);
    }
    written += static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0) {
    const auto message = ErrnoMessage();
    ::close(fd);
    throw PersistenceError("failed to fsync " + path.string() + ": " + message);
  }
  if (::close(fd) != 0) {
    throw PersistenceError("failed to close " + path.string() + ": " + ErrnoMessage());
  }
}

// Makes a completed rename inside dir durable. The new file is already in
// place, so a failure here is only logged.
void SyncDirectory(const std::filesystem::path& dir) {
  const auto target = dir.empty() ? std::filesystem::path(".") : dir;
  const int  fd     = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0 || ::fsync(fd) != 0) {
    PROXICLOUD_LOG_WARN("Failed to fsync store directory", {StringField("dir", target.string()), StringField("error", ErrnoMessage())});
  }
  if (fd >= 0) {
    ::close(fd);
  }
}

int64_t NowSeconds() {
  return proxicloud::util::ToUnixSeconds(proxicloud::util::Now());
}

std::string RangeString(int32_t start, int32_t end) {
  return std::to_string(start) + "-" + std::to_string(end);
}

} // namespace

ProjectStore::ProjectStore(std::filesystem::path path) : path_(std::move(path)) {
  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw PersistenceError("failed to create directory " + path_.parent_path().string() + ": " + ec.message());
    }
  }

  Load();
}

// ------------------------------------------------------------
// Persistence
// ------------------------------------------------------------

void ProjectStore::Load() {
  std::ifstream in(path_);
  if (!in) {
    // First start: nothing persisted yet.
    return;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  ProjectStoreState stored;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &stored, options);
  if (!status.ok()) {
    throw PersistenceError("failed to parse " + path_.string() + ": " + std::string(status.message()));
  }

  for (const auto& [id, project] : stored.projects()) {
    state_.projects[id] = project;
  }
  for (const auto& [vmid, project_id] : stored.vmid_map()) {
    state_.vmid_map[vmid] = project_id;
  }

  PROXICLOUD_LOG_INFO("Loaded project store", {StringField("path", path_.string()), IntField("projects", static_cast<int64_t>(state_.projects.size())),
                                               IntField("assignments", static_cast<int64_t>(state_.vmid_map.size()))});
}

/*
  Atomic write:
      serialize → write tmp → flush → rename
*/
void ProjectStore::Persist(const State& state) const {
  ProjectStoreState stored;
  for (const auto& [id, project] : state.projects) {
    (*stored.mutable_projects())[id] = project;
  }
  for (const auto& [vmid, project_id] : state.vmid_map) {
    (*stored.mutable_vmid_map())[vmid] = project_id;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(stored, &json, options);
  if (!status.ok()) {
    throw PersistenceError("failed to serialize project store: " + std::string(status.message()));
  }

  const auto tmp_path = std::filesystem::path(path_.string() + ".tmp");

  try {
    WriteFileDurably(tmp_path, json);
  } catch (const PersistenceError&) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw PersistenceError("failed to rename " + tmp_path.string() + ": " + ec.message());
  }

  SyncDirectory(path_.parent_path());
}

// ------------------------------------------------------------
// Checks (caller holds the lock)
// ------------------------------------------------------------

const Project& ProjectStore::FindOrThrow(const State& state, const std::string& id) const {
  auto it = state.projects.find(id);
  if (it == state.projects.end()) {
    throw NotFound("project not found: " + id);
  }
  return it->second;
}

void ProjectStore::CheckNameAvailable(const State& state, const std::string& exclude_id, const std::string& name) const {
  for (const auto& [id, project] : state.projects) {
    if (id != exclude_id && project.name() == name) {
      throw Conflict("project with name '" + name + "' already exists");
    }
  }
}

void ProjectStore::CheckRange(const State& state, const std::string& exclude_id, int32_t start, int32_t end) const {
  if (start <= 0) {
    throw ValidationError("container_id_start must be greater than 0");
  }
  if (end <= 0) {
    throw ValidationError("container_id_end must be greater than 0");
  }
  if (start > end) {
    throw ValidationError("container_id_start (" + std::to_string(start) + ") must be less than or equal to container_id_end (" +
                          std::to_string(end) + ")");
  }
  if (start < kMinContainerID) {
    throw ValidationError("container_id_start must be >= 100 (Proxmox reserves IDs below 100)");
  }

  for (const auto& [id, project] : state.projects) {
    if (id == exclude_id || !project.has_container_id_start() || !project.has_container_id_end()) {
      continue;
    }

    const auto existing_start = project.container_id_start();
    const auto existing_end   = project.container_id_end();

    if ((start >= existing_start && start <= existing_end) || (end >= existing_start && end <= existing_end) ||
        (start <= existing_start && end >= existing_end)) {
      throw Conflict("container ID range " + RangeString(start, end) + " overlaps with project '" + project.name() + "' range " +
                     RangeString(existing_start, existing_end));
    }
  }
}

void ProjectStore::CheckCreate(const State& state, const std::string& id, const CreateProjectRequest& req) const {
  if (req.name().empty()) {
    throw ValidationError("project name is required");
  }
  if (id.empty()) {
    throw ValidationError("project id is required");
  }
  if (state.projects.count(id) != 0) {
    throw Conflict("project id already exists: " + id);
  }

  CheckNameAvailable(state, id, req.name());

  if (req.has_container_id_start() != req.has_container_id_end()) {
    throw ValidationError("both container_id_start and container_id_end must be provided together");
  }
  if (req.has_container_id_start()) {
    CheckRange(state, id, req.container_id_start(), req.container_id_end());
  }
}

// ------------------------------------------------------------
// Projects
// ------------------------------------------------------------

Project ProjectStore::CreateProject(const CreateProjectRequest& req) {
  return CreateProjectWithID(proxicloud::util::NewProjectID(), req);
}

Project ProjectStore::CreateProjectWithID(const std::string& id, const CreateProjectRequest& req) {
  std::unique_lock lock(mutex_);

  CheckCreate(state_, id, req);

  const auto now = NowSeconds();

  Project project;
  project.set_id(id);
  project.set_name(req.name());
  project.set_description(req.description());
  *project.mutable_tags() = req.tags();
  if (req.has_network()) {
    *project.mutable_network() = req.network();
  }
  if (req.has_container_id_start()) {
    project.set_container_id_start(req.container_id_start());
    project.set_container_id_end(req.container_id_end());
  }
  project.set_created_at(now);
  project.set_updated_at(now);

  State working         = state_;
  working.projects[id] = project;

  Persist(working);
  state_ = std::move(working);

  return project;
}

Project ProjectStore::GetProject(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return FindOrThrow(state_, id);
}

std::vector<Project> ProjectStore::ListProjects() const {
  std::shared_lock lock(mutex_);

  std::vector<Project> projects;
  projects.reserve(state_.projects.size());
  for (const auto& [_, project] : state_.projects) {
    projects.push_back(project);
  }

  std::sort(projects.begin(), projects.end(), [](const Project& a, const Project& b) {
    if (a.created_at() != b.created_at()) {
      return a.created_at() < b.created_at();
    }
    return a.name() < b.name();
  });
  return projects;
}

/*
  Partial update: only fields present in the request overwrite.
  Network topology and generated SDN identifiers are fixed at creation;
  only the nameserver may change.
*/
Project ProjectStore::UpdateProject(const std::string& id, const UpdateProjectRequest& req) {
  std::unique_lock lock(mutex_);

  State working = state_;
  auto  it      = working.projects.find(id);
  if (it == working.projects.end()) {
    throw NotFound("project not found: " + id);
  }
  auto& project = it->second;

  if (!req.name().empty()) {
    CheckNameAvailable(working, id, req.name());
    project.set_name(req.name());
  }

  if (!req.description().empty()) {
    project.set_description(req.description());
  }

  if (req.has_tags()) {
    *project.mutable_tags() = req.tags().values();
  }

  if (req.has_network()) {
    const auto& update = req.network();
    if (!project.has_network()) {
      throw ValidationError("network can only be configured when the project is created");
    }

    auto* network = project.mutable_network();
    if ((!update.subnet().empty() && update.subnet() != network->subnet()) ||
        (!update.gateway().empty() && update.gateway() != network->gateway()) ||
        (update.vlan_tag() != 0 && update.vlan_tag() != network->vlan_tag())) {
      throw ValidationError("subnet, gateway and vlan_tag cannot be changed after the network is provisioned");
    }
    if (!update.nameserver().empty()) {
      network->set_nameserver(update.nameserver());
    }
  }

  if (req.has_container_id_start() || req.has_container_id_end()) {
    const bool has_start = req.has_container_id_start() || project.has_container_id_start();
    const bool has_end   = req.has_container_id_end() || project.has_container_id_end();
    if (!has_start || !has_end) {
      throw ValidationError("both container_id_start and container_id_end must be provided together");
    }

    const auto start = req.has_container_id_start() ? req.container_id_start() : project.container_id_start();
    const auto end   = req.has_container_id_end() ? req.container_id_end() : project.container_id_end();
    CheckRange(working, id, start, end);

    project.set_container_id_start(start);
    project.set_container_id_end(end);
  }

  project.set_updated_at(NowSeconds());

  Project result = project;

  Persist(working);
  state_ = std::move(working);

  return result;
}

void ProjectStore::DeleteProject(const std::string& id) {
  std::unique_lock lock(mutex_);

  FindOrThrow(state_, id);

  for (const auto& [vmid, project_id] : state_.vmid_map) {
    if (project_id == id) {
      throw Conflict("cannot delete project: containers still assigned");
    }
  }

  State working = state_;
  working.projects.erase(id);

  Persist(working);
  state_ = std::move(working);
}

// ------------------------------------------------------------
// Container assignments
// ------------------------------------------------------------

void ProjectStore::AssignContainer(int32_t vmid, const std::string& project_id) {
  std::unique_lock lock(mutex_);

  if (vmid <= 0) {
    throw ValidationError("invalid vmid: " + std::to_string(vmid));
  }

  if (!project_id.empty()) {
    FindOrThrow(state_, project_id);
  }

  State working = state_;
  if (project_id.empty()) {
    working.vmid_map.erase(vmid);
  } else {
    working.vmid_map[vmid] = project_id;
  }

  Persist(working);
  state_ = std::move(working);
}

std::string ProjectStore::GetContainerProject(int32_t vmid) const {
  std::shared_lock lock(mutex_);

  auto it = state_.vmid_map.find(vmid);
  if (it == state_.vmid_map.end()) {
    return {};
  }
  return it->second;
}

std::vector<int32_t> ProjectStore::GetProjectContainers(const std::string& project_id) const {
  std::shared_lock lock(mutex_);

  std::vector<int32_t> vmids;
  for (const auto& [vmid, pid] : state_.vmid_map) {
    if (pid == project_id) {
      vmids.push_back(vmid);
    }
  }
  return vmids;
}

// ------------------------------------------------------------
// Validation / allocation
// ------------------------------------------------------------

void ProjectStore::ValidateCreate(const std::string& id, const CreateProjectRequest& req) const {
  std::shared_lock lock(mutex_);
  CheckCreate(state_, id, req);
}

void ProjectStore::ValidateContainerIDRange(const std::string& exclude_project_id, int32_t start, int32_t end) const {
  std::shared_lock lock(mutex_);
  CheckRange(state_, exclude_project_id, start, end);
}

int32_t ProjectStore::GetNextContainerIDInRange(const std::string& project_id) const {
  std::shared_lock lock(mutex_);

  const auto& project = FindOrThrow(state_, project_id);
  if (!project.has_container_id_start() || !project.has_container_id_end()) {
    throw ValidationError("project '" + project.name() + "' does not have a container ID range configured");
  }

  const auto start = project.container_id_start();
  const auto end   = project.container_id_end();

  for (int64_t candidate = start; candidate <= end; ++candidate) {
    auto it = state_.vmid_map.find(static_cast<int32_t>(candidate));
    if (it == state_.vmid_map.end() || it->second != project_id) {
      return static_cast<int32_t>(candidate);
    }
  }

  throw NotFound("no available container IDs in range " + RangeString(start, end) + " for project '" + project.name() + "'");
}

} // namespace proxicloud::project
