#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/coordination/release_coordinator.hpp"
#include "internal/executor/command_executor.hpp"
#include "internal/executor/grpc_executor.hpp"
#include "internal/grpc/coordinator_server.hpp"
#include "internal/notes/release_notes_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/release_registry.hpp"
#include "internal/service/coordinator_service.hpp"
#include "internal/service/service_context.hpp"

namespace release::factory {

using observability::IntField;
using observability::StringField;

namespace {

std::filesystem::path ProjectPath(const release::runtime::config::RuntimeConfig& config) {
  const auto& configured = config.registry().project_path();
  return configured.empty() ? std::filesystem::current_path() : std::filesystem::path(configured);
}

} // namespace

std::shared_ptr<executor::DeploymentExecutor> BuildExecutor(const release::runtime::config::ExecutorConfig& config) {
  if (config.has_grpc()) {
    const auto& agent = config.grpc();
    if (agent.target().empty()) {
      throw std::runtime_error("executor.grpc.target is required");
    }
    auto credentials = agent.insecure() ? ::grpc::InsecureChannelCredentials() : ::grpc::SslCredentials(::grpc::SslCredentialsOptions{});
    RELEASE_LOG_INFO("Using gRPC deployment agent", {StringField("target", agent.target())});
    return std::make_shared<executor::GrpcDeploymentExecutor>(::grpc::CreateChannel(agent.target(), credentials));
  }

  if (config.has_command()) {
    const auto& command = config.command();
    if (command.deploy_command().empty()) {
      throw std::runtime_error("executor.command.deploy_command is required");
    }
    RELEASE_LOG_INFO("Using command deployment executor", {StringField("deploy_command", command.deploy_command())});
    return std::make_shared<executor::CommandDeploymentExecutor>(command.deploy_command(), command.rollback_command(), command.working_dir());
  }

  throw std::runtime_error("executor backend not configured (expected executor.grpc or executor.command)");
}

Application Build(const release::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto project_path = ProjectPath(config);

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.registry = std::make_shared<registry::ReleaseRegistry>(project_path);
  app.registry->Initialize();

  // ------------------------------------------------------------------
  // Coordination
  // ------------------------------------------------------------------
  coordination::CoordinatorOptions options;
  options.max_parallel_deployments = config.coordinator().max_parallel_deployments();
  options.default_deploy_timeout   = std::chrono::milliseconds(config.coordinator().default_deploy_timeout_ms());

  auto notes_generator = std::make_shared<notes::PathReleaseNotesGenerator>(project_path);
  app.coordinator      = std::make_shared<coordination::ReleaseCoordinator>(app.registry, BuildExecutor(config.executor()), notes_generator, options);

  RELEASE_LOG_INFO("Release coordinator ready",
                   {StringField("registry", app.registry->RegistryPath().string()),
                    IntField("max_parallel_deployments", options.max_parallel_deployments),
                    IntField("default_deploy_timeout_ms", static_cast<std::int64_t>(options.default_deploy_timeout.count()))});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.coordinator = app.coordinator;
  ctx.registry    = app.registry;

  auto coordinator_service = std::make_shared<service::CoordinatorService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::CoordinatorServer>(coordinator_service));

  return app;
}

} // namespace release::factory
