#include "grpc_executor.hpp"

#include <grpcpp/client_context.h>

#include "internal/util/errors.hpp"

namespace release::executor {

using namespace release::coordinator::v1;

namespace {

void ThrowIfRpcFailed(const ::grpc::Status& status, const std::string& action, const std::string& service) {
  if (status.ok()) {
    return;
  }
  if (status.error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED) {
    throw util::DeploymentError("service '" + service + "': " + action + " timed out");
  }
  throw util::DeploymentError("service '" + service + "': " + action + " failed: " + status.error_message());
}

HealthStatus HealthOrDefault(HealthStatus reported, bool success) {
  if (reported != HEALTH_STATUS_UNSPECIFIED) {
    return reported;
  }
  return success ? HEALTH_STATUS_HEALTHY : HEALTH_STATUS_UNHEALTHY;
}

} // namespace

GrpcDeploymentExecutor::GrpcDeploymentExecutor(std::shared_ptr<::grpc::Channel> channel) : stub_(DeploymentAgentService::NewStub(channel)) {
}

ServiceResult GrpcDeploymentExecutor::Deploy(const ServiceDeclaration& service, Environment environment,
                                             std::optional<std::chrono::milliseconds> timeout) {
  ::grpc::ClientContext ctx;
  if (timeout) {
    ctx.set_deadline(std::chrono::system_clock::now() + *timeout);
  }

  DeployRequest req;
  *req.mutable_service() = service;
  req.set_environment(environment);

  DeployResponse resp;
  ThrowIfRpcFailed(stub_->Deploy(&ctx, req, &resp), "deploy", service.name());

  ServiceResult result;
  result.set_service(service.name());
  result.set_version(service.version());
  result.set_deployment_id(resp.deployment_id());
  result.set_status(resp.success() ? SERVICE_STATUS_SUCCESS : SERVICE_STATUS_FAILED);
  result.set_health_status(HealthOrDefault(resp.health_status(), resp.success()));
  result.set_message(resp.message());
  return result;
}

ServiceResult GrpcDeploymentExecutor::Rollback(const ServiceDeclaration& service, Environment environment, const std::string& reason) {
  ::grpc::ClientContext ctx;

  RollbackRequest req;
  *req.mutable_service() = service;
  req.set_environment(environment);
  req.set_reason(reason);

  RollbackResponse resp;
  ThrowIfRpcFailed(stub_->Rollback(&ctx, req, &resp), "rollback", service.name());

  ServiceResult result;
  result.set_service(service.name());
  result.set_version(service.version());
  result.set_deployment_id(resp.rollback_id());
  result.set_status(resp.success() ? SERVICE_STATUS_ROLLED_BACK : SERVICE_STATUS_FAILED);
  result.set_health_status(HealthOrDefault(resp.health_status(), resp.success()));
  result.set_message(resp.message());
  return result;
}

} // namespace release::executor
