#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using bay::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "bay_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestDefaultsFillAnEmptyDocument() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("empty", "").string());

  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(!config.database().has_sqlite());
  assert(config.driver().endpoint() == "127.0.0.1:50061");
  assert(config.driver().tag_namespace() == "bay");

  assert(config.profiles_size() == 1);
  const auto& profile = config.profiles(0);
  assert(profile.id() == "python-default");
  assert(profile.runtime_type() == "ship");
  assert(profile.capabilities_size() == 3);
  assert(profile.idle_timeout_seconds() == 1800);
  assert(config.sandbox().default_profile() == "python-default");

  assert(config.idempotency().enabled());
  assert(config.idempotency().ttl_seconds() == 3600);
  assert(config.sandbox().max_extend_seconds() == 86400);
  assert(config.sandbox().readiness().max_attempts() == 0);
  assert(config.sandbox().readiness().timeout_ms() == 120000);

  assert(config.gc().enabled());
  assert(config.gc().run_on_startup());
  assert(config.gc().expired_sandbox().enabled());
  assert(config.gc().expired_sandbox().interval_seconds() == 60);
  assert(config.gc().orphan_instance().interval_seconds() == 300);
  assert(config.gc().stale_session().enabled());
  assert(config.gc().stale_session().interval_seconds() == 300);
  assert(config.gc().expired_idempotency().interval_seconds() == 3600);
  assert(!config.gc().include_external_workspaces());
  assert(config.workspace().mount_path() == "/workspace");
}

void TestExplicitValuesSurviveDefaults() {
  const auto yaml_path = WriteYaml("explicit",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "/var/lib/bay/bay.db"
driver:
  endpoint: "driver.internal:9000"
  tag_namespace: "bay-staging"
profiles:
  - id: "python-small"
    image: "ship:3.12"
    cpus: 0.5
    memory: "512m"
    capabilities: ["python", "filesystem"]
    idle_timeout_seconds: 300
  - id: "node"
    image: "ship-node:latest"
sandbox:
  default_profile: "node"
  max_extend_seconds: 7200
idempotency:
  enabled: false
gc:
  run_on_startup: false
  idle_session:
    enabled: false
  include_external_workspaces: true
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().sqlite().path() == "/var/lib/bay/bay.db");
  assert(config.driver().tag_namespace() == "bay-staging");

  assert(config.profiles_size() == 2);
  assert(config.profiles(0).cpus() == 0.5);
  assert(config.profiles(0).capabilities_size() == 2);
  assert(config.profiles(0).idle_timeout_seconds() == 300);
  assert(config.profiles(1).runtime_type() == "ship");
  assert(config.profiles(1).capabilities_size() == 3);
  assert(config.sandbox().default_profile() == "node");
  assert(config.sandbox().max_extend_seconds() == 7200);

  // Explicit false is not mistaken for "absent".
  assert(!config.idempotency().enabled());
  assert(config.gc().enabled());
  assert(!config.gc().run_on_startup());
  assert(!config.gc().idle_session().enabled());
  assert(config.gc().expired_sandbox().enabled());
  assert(config.gc().include_external_workspaces());
}

void TestUnknownFieldsAreRejected() {
  assert(LoadThrows("unknown_field", R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)"));
}

void TestInvalidConfigurationsAreRejected() {
  assert(LoadThrows("unknown_default_profile", R"(sandbox:
  default_profile: "missing"
)"));

  assert(LoadThrows("duplicate_profile", R"(profiles:
  - id: "a"
    image: "ship:latest"
  - id: "a"
    image: "ship:latest"
)"));

  assert(LoadThrows("profile_without_image", R"(profiles:
  - id: "a"
)"));

  assert(LoadThrows("sqlite_without_path", R"(database:
  sqlite:
    path: ""
)"));

  assert(LoadThrows("relative_mount", R"(workspace:
  mount_path: "workspace"
)"));

  assert(LoadThrows("bad_backoff", R"(sandbox:
  readiness:
    initial_backoff_ms: 2000
    max_backoff_ms: 100
)"));
}

void TestMissingFileIsAnError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/bay/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestResolvePathPrecedence() {
  const auto from_env = WriteYaml("from_env", "");
  ::setenv("BAY_CONFIG_FILE", from_env.c_str(), 1);

  assert(ConfigLoader::ResolvePath("/explicit/config.yaml") == "/explicit/config.yaml");
  assert(ConfigLoader::ResolvePath("") == from_env.string());

  ::unsetenv("BAY_CONFIG_FILE");
}

} // namespace

int main() {
  TestDefaultsFillAnEmptyDocument();
  TestExplicitValuesSurviveDefaults();
  TestUnknownFieldsAreRejected();
  TestInvalidConfigurationsAreRejected();
  TestMissingFileIsAnError();
  TestResolvePathPrecedence();

  std::cout << "bay_unit_config_loader: pass\n";
  return 0;
}
