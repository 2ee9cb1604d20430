#include "internal/core/profile_registry.hpp"

#include "internal/util/errors.hpp"

namespace bay::core {

ProfileRegistry::ProfileRegistry(const bay::runtime::config::RuntimeConfig& config) : default_profile_(config.sandbox().default_profile()) {
  for (const auto& profile : config.profiles()) {
    profiles_[profile.id()] = profile;
  }
}

std::optional<ProfileRegistry::Profile> ProfileRegistry::Find(const std::string& id) const {
  auto it = profiles_.find(id);
  if (it == profiles_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const ProfileRegistry::Profile& ProfileRegistry::Require(const std::string& id) const {
  const auto& resolved = id.empty() ? default_profile_ : id;
  auto        it       = profiles_.find(resolved);
  if (it == profiles_.end()) {
    throw util::ValidationError("unknown profile '" + resolved + "'; configure it under profiles");
  }
  return it->second;
}

} // namespace bay::core
