#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "release_coordinator_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
registry:
  project_path: "/srv/releases"
coordinator:
  max_parallel_deployments: 4
  default_deploy_timeout_ms: 300000
executor:
  command:
    deploy_command: "./deploy.sh"
    rollback_command: "./rollback.sh"
    working_dir: "/srv/releases"
logging:
  level: debug
  file_path: "/var/log/release-coordinator.log"
  max_files: 5
observability:
  tracing_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = release::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.registry().project_path() == "/srv/releases");
  assert(config.coordinator().max_parallel_deployments() == 4);
  assert(config.coordinator().default_deploy_timeout_ms() == 300000);
  assert(config.executor().has_command());
  assert(config.executor().command().rollback_command() == "./rollback.sh");
  assert(config.logging().level() == "debug");
  assert(config.logging().max_files() == 5);
  assert(config.observability().transport() == release::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
executor:
  grpc:
    target: "agent:7000"
    insecure: true
)");

  auto config = release::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.executor().grpc().insecure());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)release::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestReleaseRequestAcceptsLowercaseNames() {
  const auto yaml_path = WriteYaml("request",
                                   R"(release_name: "Spring Release"
environment: production
strategy: dependency-order
rollback_on_failure: true
deploy_timeout_ms: 60000
notify_channels: ["#releases"]
services:
  - name: database
    version: "2"
  - name: api
    version: "3.1.0"
    dependencies: [database]
    config:
      replicas: 3
      region: eu-west-1
)");

  const auto req = release::config::ConfigLoader::LoadReleaseRequest(yaml_path.string());
  assert(req.release_name() == "Spring Release");
  assert(req.environment() == release::coordinator::v1::ENVIRONMENT_PRODUCTION);
  assert(req.strategy() == release::coordinator::v1::STRATEGY_DEPENDENCY_ORDER);
  assert(req.rollback_on_failure());
  assert(req.deploy_timeout_ms() == 60000);
  assert(req.notify_channels_size() == 1);
  assert(req.services_size() == 2);
  assert(req.services(0).version() == "2");
  assert(req.services(1).dependencies(0) == "database");
  assert(req.services(1).config().fields().at("replicas").number_value() == 3);
  assert(req.services(1).config().fields().at("region").string_value() == "eu-west-1");
}

void TestReleaseRequestKeepsPlainScalarsAsStrings() {
  const auto yaml_path = WriteYaml("plain_scalars",
                                   R"(release_name: 2024
environment: staging
services:
  - name: inf
    version: 2.0
  - name: api
    version: 10
    dependencies: [inf]
    config:
      replicas: 3
)");

  const auto req = release::config::ConfigLoader::LoadReleaseRequest(yaml_path.string());
  assert(req.release_name() == "2024");
  assert(req.services_size() == 2);
  assert(req.services(0).name() == "inf");
  assert(req.services(0).version() == "2.0");
  assert(req.services(1).version() == "10");
  assert(req.services(1).dependencies(0) == "inf");
  // Free-form config keeps YAML typing.
  assert(req.services(1).config().fields().at("replicas").number_value() == 3);
}

void TestReleaseRequestRejectsUnknownEnvironment() {
  const auto yaml_path = WriteYaml("bad_environment",
                                   R"(release_name: "x"
environment: qa
services:
  - name: api
)");

  bool threw = false;
  try {
    (void)release::config::ConfigLoader::LoadReleaseRequest(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestReleaseRequestAcceptsLowercaseNames();
  TestReleaseRequestKeepsPlainScalarsAsStrings();
  TestReleaseRequestRejectsUnknownEnvironment();

  std::cout << "release_coordinator_unit_config_loader: pass\n";
  return 0;
}
