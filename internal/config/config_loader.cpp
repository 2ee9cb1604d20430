#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace bay::config {

using namespace bay::runtime::config;

namespace {

constexpr const char* kDefaultProfileId = "python-default";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

void DefaultRetryPolicy(RetryPolicyConfig* policy, uint32_t attempts, uint32_t initial_ms, uint32_t max_ms, uint32_t timeout_ms) {
  if (policy->max_attempts() == 0) policy->set_max_attempts(attempts);
  if (policy->initial_backoff_ms() == 0) policy->set_initial_backoff_ms(initial_ms);
  if (policy->max_backoff_ms() == 0) policy->set_max_backoff_ms(max_ms);
  if (policy->backoff_factor() == 0) policy->set_backoff_factor(2.0);
  if (policy->timeout_ms() == 0) policy->set_timeout_ms(timeout_ms);
}

void DefaultGcTask(GcTaskConfig* task, uint32_t interval_seconds) {
  if (!task->has_enabled()) task->set_enabled(true);
  if (task->interval_seconds() == 0) task->set_interval_seconds(interval_seconds);
}

void DefaultProfile(ProfileConfig* profile) {
  if (profile->runtime_type().empty()) profile->set_runtime_type("ship");
  if (profile->cpus() == 0) profile->set_cpus(1.0);
  if (profile->memory().empty()) profile->set_memory("1g");
  if (profile->capabilities().empty()) {
    profile->add_capabilities("filesystem");
    profile->add_capabilities("shell");
    profile->add_capabilities("python");
  }
  if (profile->idle_timeout_seconds() == 0) profile->set_idle_timeout_seconds(1800);
  if (profile->runtime_port() == 0) profile->set_runtime_port(8123);
}

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Invalid configuration: " + message);
  }
}

void ValidateRetryPolicy(const RetryPolicyConfig& policy, const std::string& key) {
  Require(policy.backoff_factor() >= 1.0, key + ".backoff_factor must be >= 1");
  Require(policy.max_backoff_ms() >= policy.initial_backoff_ms(), key + ".max_backoff_ms must be >= initial_backoff_ms");
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  Validate(config);
  return config;
}

std::string ConfigLoader::ResolvePath(const std::string& explicit_path) {
  if (!explicit_path.empty()) {
    return explicit_path;
  }
  if (const char* env = std::getenv("BAY_CONFIG_FILE"); env && *env) {
    return env;
  }
  for (const char* candidate : {"config.yaml", "/etc/bay/config.yaml"}) {
    if (std::ifstream(candidate).good()) {
      return candidate;
    }
  }
  return {};
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");

  auto* database = config.mutable_database();
  if (database->backend_case() == DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }

  auto* driver = config.mutable_driver();
  if (driver->endpoint().empty()) driver->set_endpoint("127.0.0.1:50061");
  if (driver->timeout_ms() == 0) driver->set_timeout_ms(30000);
  if (driver->tag_namespace().empty()) driver->set_tag_namespace("bay");

  auto* runtime = config.mutable_runtime();
  if (runtime->timeout_ms() == 0) runtime->set_timeout_ms(5000);

  if (config.profiles().empty()) {
    auto* profile = config.add_profiles();
    profile->set_id(kDefaultProfileId);
    profile->set_image("ship:latest");
  }
  for (auto& profile : *config.mutable_profiles()) {
    DefaultProfile(&profile);
  }

  auto* workspace = config.mutable_workspace();
  if (workspace->default_size_limit_mb() == 0) workspace->set_default_size_limit_mb(1024);
  if (workspace->mount_path().empty()) workspace->set_mount_path("/workspace");

  auto* idempotency = config.mutable_idempotency();
  if (!idempotency->has_enabled()) idempotency->set_enabled(true);
  if (idempotency->ttl_seconds() == 0) idempotency->set_ttl_seconds(3600);

  auto* sandbox = config.mutable_sandbox();
  if (sandbox->default_profile().empty()) sandbox->set_default_profile(config.profiles(0).id());
  if (sandbox->max_extend_seconds() == 0) sandbox->set_max_extend_seconds(86400);
  if (sandbox->retry_after_ms() == 0) sandbox->set_retry_after_ms(1000);
  // Readiness is bounded by time only: max_attempts stays 0 (unlimited).
  DefaultRetryPolicy(sandbox->mutable_readiness(), 0, 500, 1000, 120000);

  auto* gc = config.mutable_gc();
  if (!gc->has_enabled()) gc->set_enabled(true);
  if (!gc->has_run_on_startup()) gc->set_run_on_startup(true);
  DefaultGcTask(gc->mutable_expired_sandbox(), 60);
  DefaultGcTask(gc->mutable_idle_session(), 60);
  DefaultGcTask(gc->mutable_stale_session(), 300);
  DefaultGcTask(gc->mutable_orphan_workspace(), 300);
  DefaultGcTask(gc->mutable_orphan_instance(), 300);
  DefaultGcTask(gc->mutable_expired_idempotency(), 3600);
  DefaultRetryPolicy(gc->mutable_item_retry(), 3, 200, 1000, 10000);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    Require(!database.sqlite().path().empty(), "database.sqlite.path is required");
  }
  if (database.has_postgres()) {
    Require(!database.postgres().connection_uri().empty(), "database.postgres.connection_uri is required");
  }

  std::unordered_set<std::string> ids;
  for (const auto& profile : config.profiles()) {
    Require(!profile.id().empty(), "profiles[].id is required");
    Require(ids.insert(profile.id()).second, "duplicate profile id '" + profile.id() + "'");
    Require(!profile.image().empty(), "profiles[" + profile.id() + "].image is required");
    Require(profile.cpus() > 0, "profiles[" + profile.id() + "].cpus must be > 0");
  }
  Require(ids.count(config.sandbox().default_profile()) == 1,
          "sandbox.default_profile '" + config.sandbox().default_profile() + "' is not a configured profile");

  Require(config.idempotency().ttl_seconds() > 0, "idempotency.ttl_seconds must be > 0");
  ValidateRetryPolicy(config.sandbox().readiness(), "sandbox.readiness");
  ValidateRetryPolicy(config.gc().item_retry(), "gc.item_retry");
  Require(config.workspace().mount_path().front() == '/', "workspace.mount_path must be absolute");
}

} // namespace bay::config
