#include "names.hpp"

namespace release::model {

using namespace release::coordinator::v1;

std::string EnvironmentName(Environment environment) {
  switch (environment) {
    case ENVIRONMENT_STAGING:
      return "staging";
    case ENVIRONMENT_PRODUCTION:
      return "production";
    default:
      return "unspecified";
  }
}

std::string StrategyName(Strategy strategy) {
  switch (strategy) {
    case STRATEGY_SEQUENTIAL:
      return "sequential";
    case STRATEGY_PARALLEL:
      return "parallel";
    default:
      return "dependency-order";
  }
}

std::string ReleaseStatusName(ReleaseStatus status) {
  switch (status) {
    case RELEASE_STATUS_PENDING:
      return "pending";
    case RELEASE_STATUS_IN_PROGRESS:
      return "in-progress";
    case RELEASE_STATUS_SUCCESS:
      return "success";
    case RELEASE_STATUS_FAILED:
      return "failed";
    case RELEASE_STATUS_ROLLED_BACK:
      return "rolled-back";
    default:
      return "unspecified";
  }
}

std::string ServiceStatusName(ServiceStatus status) {
  switch (status) {
    case SERVICE_STATUS_SUCCESS:
      return "success";
    case SERVICE_STATUS_FAILED:
      return "failed";
    case SERVICE_STATUS_ROLLED_BACK:
      return "rolled-back";
    case SERVICE_STATUS_SKIPPED:
      return "skipped";
    default:
      return "unspecified";
  }
}

std::string HealthStatusName(HealthStatus status) {
  switch (status) {
    case HEALTH_STATUS_HEALTHY:
      return "healthy";
    case HEALTH_STATUS_DEGRADED:
      return "degraded";
    case HEALTH_STATUS_UNHEALTHY:
      return "unhealthy";
    default:
      return "unspecified";
  }
}

std::optional<Environment> ParseEnvironment(std::string_view name) {
  if (name == "staging" || name == "ENVIRONMENT_STAGING") return ENVIRONMENT_STAGING;
  if (name == "production" || name == "ENVIRONMENT_PRODUCTION") return ENVIRONMENT_PRODUCTION;
  return std::nullopt;
}

std::optional<Strategy> ParseStrategy(std::string_view name) {
  if (name == "sequential" || name == "STRATEGY_SEQUENTIAL") return STRATEGY_SEQUENTIAL;
  if (name == "parallel" || name == "STRATEGY_PARALLEL") return STRATEGY_PARALLEL;
  if (name == "dependency-order" || name == "STRATEGY_DEPENDENCY_ORDER") return STRATEGY_DEPENDENCY_ORDER;
  return std::nullopt;
}

bool IsDeployableEnvironment(Environment environment) {
  return environment == ENVIRONMENT_STAGING || environment == ENVIRONMENT_PRODUCTION;
}

} // namespace release::model
