#include "internal/adapter/runtime_adapter.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace bay::adapter {

RuntimeMeta RuntimeAdapter::Meta() {
  std::lock_guard lock(meta_mutex_);
  if (!meta_) {
    meta_ = FetchMeta();
  }
  return *meta_;
}

bool RuntimeAdapter::SupportsCapability(const std::string& capability) {
  const auto meta = Meta();
  return std::find(meta.capabilities.begin(), meta.capabilities.end(), capability) != meta.capabilities.end();
}

void AdapterRegistry::Register(const std::string& runtime_type, AdapterFactory factory) {
  factories_[runtime_type] = std::move(factory);
}

bool AdapterRegistry::Supports(const std::string& runtime_type) const {
  return factories_.contains(runtime_type);
}

std::shared_ptr<RuntimeAdapter> AdapterRegistry::Create(const std::string& runtime_type, const std::string& endpoint) const {
  auto it = factories_.find(runtime_type);
  if (it == factories_.end()) {
    throw util::ValidationError("create runtime adapter: unsupported runtime type '" + runtime_type + "'");
  }
  return it->second(endpoint);
}

} // namespace bay::adapter
