#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "release/coordinator/v1/types.pb.h"

namespace release::executor {

/*
  Deploys or rolls back a single service.

  Implementations report the outcome in the returned ServiceResult (status,
  deployment_id, health_status, message) and may throw util::DeploymentError
  instead. A deploy that cannot finish within `timeout` must fail rather than
  keep running; the coordinator counts a timeout as a failure.

  Calls for different services arrive concurrently from the coordinator's
  batch workers.
*/
class DeploymentExecutor {
 public:
  virtual ~DeploymentExecutor() = default;

  virtual release::coordinator::v1::ServiceResult Deploy(const release::coordinator::v1::ServiceDeclaration& service,
                                                         release::coordinator::v1::Environment              environment,
                                                         std::optional<std::chrono::milliseconds>          timeout) = 0;

  virtual release::coordinator::v1::ServiceResult Rollback(const release::coordinator::v1::ServiceDeclaration& service,
                                                           release::coordinator::v1::Environment environment, const std::string& reason) = 0;
};

} // namespace release::executor
