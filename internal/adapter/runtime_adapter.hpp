#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bay::adapter {

struct RuntimeMeta {
  std::string              runtime_type;
  std::string              version;
  std::vector<std::string> capabilities;
};

/*
  Client for the runtime process inside one compute instance.

  One implementation per runtime family. An adapter is bound to a single
  session endpoint for its lifetime; the capability list is fetched once
  and cached.
*/
class RuntimeAdapter {
 public:
  virtual ~RuntimeAdapter() = default;

  virtual const std::string& RuntimeType() const = 0;
  virtual const std::string& Endpoint() const    = 0;

  // Liveness probe. Transport failures report false rather than throwing.
  virtual bool Healthy() = 0;

  // Throws util::DriverError when the runtime cannot be reached.
  RuntimeMeta Meta();

  bool SupportsCapability(const std::string& capability);

 protected:
  virtual RuntimeMeta FetchMeta() = 0;

 private:
  std::mutex                 meta_mutex_;
  std::optional<RuntimeMeta> meta_;
};

using AdapterFactory = std::function<std::shared_ptr<RuntimeAdapter>(const std::string& endpoint)>;

/*
  Maps a runtime type (profile.runtime_type) to its adapter implementation.
  Populated at startup; read-only afterwards.
*/
class AdapterRegistry {
 public:
  void Register(const std::string& runtime_type, AdapterFactory factory);

  bool Supports(const std::string& runtime_type) const;

  // Throws util::ValidationError for an unregistered runtime type.
  std::shared_ptr<RuntimeAdapter> Create(const std::string& runtime_type, const std::string& endpoint) const;

 private:
  std::unordered_map<std::string, AdapterFactory> factories_;
};

} // namespace bay::adapter
