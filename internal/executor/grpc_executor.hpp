#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "deployment_executor.hpp"
#include "release/coordinator/v1/agent_service.grpc.pb.h"

namespace release::executor {

/*
  Delegates to a remote DeploymentAgentService. The per-service timeout
  becomes the RPC deadline; DEADLINE_EXCEEDED and every other non-OK status
  surface as util::DeploymentError.
*/
class GrpcDeploymentExecutor final : public DeploymentExecutor {
 public:
  explicit GrpcDeploymentExecutor(std::shared_ptr<::grpc::Channel> channel);

  release::coordinator::v1::ServiceResult Deploy(const release::coordinator::v1::ServiceDeclaration& service,
                                                 release::coordinator::v1::Environment              environment,
                                                 std::optional<std::chrono::milliseconds>          timeout) override;

  release::coordinator::v1::ServiceResult Rollback(const release::coordinator::v1::ServiceDeclaration& service,
                                                   release::coordinator::v1::Environment environment, const std::string& reason) override;

 private:
  std::unique_ptr<release::coordinator::v1::DeploymentAgentService::Stub> stub_;
};

} // namespace release::executor
