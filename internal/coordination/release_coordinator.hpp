#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/executor/deployment_executor.hpp"
#include "internal/graph/topological_sorter.hpp"
#include "internal/notes/release_notes_generator.hpp"
#include "internal/registry/release_registry.hpp"
#include "release/coordinator/v1/coordinator_service.pb.h"

namespace release::coordination {

struct CoordinatorOptions {
  // Worker threads per batch; 0 = one per service.
  uint32_t max_parallel_deployments = 0;
  // Used when a request carries no timeout; zero = unbounded.
  std::chrono::milliseconds default_deploy_timeout{0};
};

/*
  Health over attempted services. SKIPPED results are ignored.
    unhealthy: any FAILED, or nothing attempted
    degraded:  any ROLLED_BACK or any non-healthy report
    healthy:   otherwise
*/
release::coordinator::v1::HealthStatus AggregateHealth(const std::vector<release::coordinator::v1::ServiceResult>& results);

/*
  ReleaseCoordinator

  Drives one release end to end:

    validate -> plan batches -> deploy batch by batch -> rollback -> persist

  Validation problems (bad environment, malformed graph, cycles) raise
  util::ValidationError before any deployment or registry write. Everything
  after that point is reported in the response: executor failures become
  FAILED service results and registry failures land in registry_error.

  Batches run strictly in sequence. Inside a batch services deploy on up to
  max_parallel_deployments threads owned by the call, and the whole batch is
  awaited before the next decision.

  Holds only its collaborators, so concurrent calls are independent.
*/
class ReleaseCoordinator {
 public:
  ReleaseCoordinator(std::shared_ptr<registry::ReleaseRegistry> registry, std::shared_ptr<executor::DeploymentExecutor> executor,
                     std::shared_ptr<notes::ReleaseNotesGenerator> notes, CoordinatorOptions options = {});

  release::coordinator::v1::CoordinateReleaseResponse CoordinateRelease(const release::coordinator::v1::CoordinateReleaseRequest& request);

 private:
  struct Deployment {
    release::coordinator::v1::ServiceResult result;
    // The executor answered SUCCESS, even if the result was later failed (timeout).
    bool reported_success = false;
  };

  std::vector<Deployment> RunBatch(const graph::Batch& batch, release::coordinator::v1::Environment environment,
                                   std::optional<std::chrono::milliseconds> timeout) const;

  Deployment DeployService(const release::coordinator::v1::ServiceDeclaration& service, release::coordinator::v1::Environment environment,
                           std::optional<std::chrono::milliseconds> timeout) const;

  release::coordinator::v1::ServiceResult RollbackService(const release::coordinator::v1::ServiceDeclaration& service,
                                                          const release::coordinator::v1::ServiceResult& deployed,
                                                          release::coordinator::v1::Environment environment, const std::string& reason) const;

  std::shared_ptr<registry::ReleaseRegistry>      registry_;
  std::shared_ptr<executor::DeploymentExecutor>   executor_;
  std::shared_ptr<notes::ReleaseNotesGenerator>   notes_;
  CoordinatorOptions                              options_;
};

} // namespace release::coordination
