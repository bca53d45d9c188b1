#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "proxicloud/v1/project.pb.h"

namespace proxicloud::proxmox {

/*
  Read-only view of the LXC containers living on the configured node.
  Returned containers carry vmid, name, status, mem and maxmem; project_id
  is left empty.
*/
class ContainerApi {
 public:
  virtual ~ContainerApi() = default;

  virtual std::vector<proxicloud::v1::Container> ListContainers() = 0;

  // std::nullopt when the hypervisor reports the container does not exist.
  virtual std::optional<proxicloud::v1::Container> GetContainer(int32_t vmid) = 0;

  // Lowest VMID not used anywhere in the cluster.
  virtual int32_t NextVMID() = 0;
};

} // namespace proxicloud::proxmox
