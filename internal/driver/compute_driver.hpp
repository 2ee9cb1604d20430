#pragma once

#include <map>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace bay::driver {

/*
  Labels stamped on every instance and volume the control plane creates.

  Orphan reconciliation only ever looks at resources carrying
  kManagedByLabel=<tag namespace>.
*/
inline constexpr const char* kManagedByLabel = "bay.managed-by";
inline constexpr const char* kOwnerLabel     = "bay.owner";
inline constexpr const char* kSandboxLabel   = "bay.sandbox_id";
inline constexpr const char* kSessionLabel   = "bay.session_id";
inline constexpr const char* kWorkspaceLabel = "bay.workspace_id";
inline constexpr const char* kProfileLabel   = "bay.profile_id";

using Labels = std::map<std::string, std::string>;

struct InstanceRequest {
  bay::runtime::config::ProfileConfig profile;
  std::string                         volume_name;
  std::string                         mount_path;
  Labels                              labels;
};

struct StartedInstance {
  std::string instance_id;
  std::string endpoint;
};

struct InstanceInfo {
  std::string instance_id;
  Labels      labels;
};

/*
  Compute driver contract.

  Every method throws util::DriverError on failure. Destroy and DeleteVolume
  succeed when the target is already gone. Calls are bounded by the driver's
  own timeout; the caller never assumes the driver's concurrency model.
*/
class ComputeDriver {
 public:
  virtual ~ComputeDriver() = default;

  virtual StartedInstance Start(const InstanceRequest& request) = 0;

  virtual void Stop(const std::string& instance_id) = 0;

  virtual void Destroy(const std::string& instance_id) = 0;

  virtual std::vector<InstanceInfo> ListInstances(const Labels& label_filter) = 0;

  virtual void CreateVolume(const std::string& name, const Labels& labels, uint32_t size_limit_mb) = 0;

  virtual void DeleteVolume(const std::string& name) = 0;
};

} // namespace bay::driver
