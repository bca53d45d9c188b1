#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "proxicloud/v1/project.pb.h"

namespace proxicloud::project {

/*
  ProjectStore

  Owns all project entities and the VMID -> project assignment map.

  CONSISTENCY MODEL:
    - One reader/writer lock guards both maps and the file write.
    - Mutations hold the write lock for their whole duration. They mutate a
      working copy, persist it (temp file + rename) and only then swap it in,
      so a failed write never leaves memory ahead of disk.
    - Reads take the shared lock and return copies.

  Committed state always satisfies:
    - project names are unique
    - declared container-ID ranges start at >= 100 and never overlap
    - a VMID maps to at most one project
    - a project with assigned VMIDs cannot be deleted
*/
class ProjectStore {
 public:
  static constexpr int32_t kMinContainerID = 100;

  explicit ProjectStore(std::filesystem::path path);

  ProjectStore(const ProjectStore&)            = delete;
  ProjectStore& operator=(const ProjectStore&) = delete;

  proxicloud::v1::Project CreateProject(const proxicloud::v1::CreateProjectRequest& req);
  proxicloud::v1::Project CreateProjectWithID(const std::string& id, const proxicloud::v1::CreateProjectRequest& req);

  proxicloud::v1::Project              GetProject(const std::string& id) const;
  std::vector<proxicloud::v1::Project> ListProjects() const;

  proxicloud::v1::Project UpdateProject(const std::string& id, const proxicloud::v1::UpdateProjectRequest& req);
  void                    DeleteProject(const std::string& id);

  // Empty project_id removes the mapping for vmid.
  void                 AssignContainer(int32_t vmid, const std::string& project_id);
  std::string          GetContainerProject(int32_t vmid) const;
  std::vector<int32_t> GetProjectContainers(const std::string& project_id) const;

  // Validates a create request against committed state without storing it.
  void ValidateCreate(const std::string& id, const proxicloud::v1::CreateProjectRequest& req) const;

  void    ValidateContainerIDRange(const std::string& exclude_project_id, int32_t start, int32_t end) const;
  int32_t GetNextContainerIDInRange(const std::string& project_id) const;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  struct State {
    std::unordered_map<std::string, proxicloud::v1::Project> projects;
    std::map<int32_t, std::string>                           vmid_map;
  };

  void Load();
  void Persist(const State& state) const;

  const proxicloud::v1::Project& FindOrThrow(const State& state, const std::string& id) const;

  void CheckCreate(const State& state, const std::string& id, const proxicloud::v1::CreateProjectRequest& req) const;
  void CheckNameAvailable(const State& state, const std::string& exclude_id, const std::string& name) const;
  void CheckRange(const State& state, const std::string& exclude_id, int32_t start, int32_t end) const;

  std::filesystem::path     path_;
  mutable std::shared_mutex mutex_;
  State                     state_;
};

} // namespace proxicloud::project
