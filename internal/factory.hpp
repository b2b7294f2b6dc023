#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace release::coordination {
class ReleaseCoordinator;
}
namespace release::executor {
class DeploymentExecutor;
}
namespace release::registry {
class ReleaseRegistry;
}

namespace release::factory {

/*
  Everything the server process keeps alive for its lifetime.
*/
struct Application {
  std::shared_ptr<release::registry::ReleaseRegistry>        registry;
  std::shared_ptr<release::coordination::ReleaseCoordinator> coordinator;
  std::vector<std::unique_ptr<::grpc::Service>>              grpc_services;
};

// Selected by executor.backend. Throws std::runtime_error when none is set.
std::shared_ptr<release::executor::DeploymentExecutor> BuildExecutor(const release::runtime::config::ExecutorConfig& config);

/*
  Composition root: the only place that knows the concrete executor,
  registry and notes generator types.
*/
Application Build(const release::runtime::config::RuntimeConfig& config);

} // namespace release::factory
