#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "config/config.pb.h"

namespace bay::core {

/*
  Named sandbox profiles (image, resources, capabilities, idle timeout).
  Immutable after construction.
*/
class ProfileRegistry {
 public:
  using Profile = bay::runtime::config::ProfileConfig;

  explicit ProfileRegistry(const bay::runtime::config::RuntimeConfig& config);

  std::optional<Profile> Find(const std::string& id) const;

  // Resolves an empty id to the default profile; throws util::ValidationError for unknown ids.
  const Profile& Require(const std::string& id) const;

  const std::string& DefaultProfileId() const {
    return default_profile_;
  }

 private:
  std::unordered_map<std::string, Profile> profiles_;
  std::string                              default_profile_;
};

} // namespace bay::core
