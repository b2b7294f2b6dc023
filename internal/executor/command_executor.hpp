#pragma once

#include <filesystem>
#include <string>

#include "deployment_executor.hpp"

namespace release::executor {

/*
  Runs operator-supplied shell commands through /bin/sh -c.

  The child sees the service in its environment:
    RELEASE_SERVICE, RELEASE_VERSION, RELEASE_ENVIRONMENT,
    RELEASE_CONFIG (JSON), RELEASE_ROLLBACK_REASON (rollback only)

  Exit status 0 is success. On timeout the child's process group is killed
  and the deploy fails.
*/
class CommandDeploymentExecutor final : public DeploymentExecutor {
 public:
  CommandDeploymentExecutor(std::string deploy_command, std::string rollback_command, std::filesystem::path working_dir = {});

  release::coordinator::v1::ServiceResult Deploy(const release::coordinator::v1::ServiceDeclaration& service,
                                                 release::coordinator::v1::Environment              environment,
                                                 std::optional<std::chrono::milliseconds>          timeout) override;

  release::coordinator::v1::ServiceResult Rollback(const release::coordinator::v1::ServiceDeclaration& service,
                                                   release::coordinator::v1::Environment environment, const std::string& reason) override;

 private:
  std::string           deploy_command_;
  std::string           rollback_command_;
  std::filesystem::path working_dir_;
};

} // namespace release::executor
