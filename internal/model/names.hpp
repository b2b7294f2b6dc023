#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "release/coordinator/v1/types.pb.h"

namespace release::model {

/*
  Lowercase names used on the command line, in file paths and in the
  child-process environment ("staging", "rolled-back", "dependency-order").
*/
std::string EnvironmentName(release::coordinator::v1::Environment environment);
std::string StrategyName(release::coordinator::v1::Strategy strategy);
std::string ReleaseStatusName(release::coordinator::v1::ReleaseStatus status);
std::string ServiceStatusName(release::coordinator::v1::ServiceStatus status);
std::string HealthStatusName(release::coordinator::v1::HealthStatus status);

// Accepts the lowercase name or the protobuf enum name.
std::optional<release::coordinator::v1::Environment> ParseEnvironment(std::string_view name);
std::optional<release::coordinator::v1::Strategy>    ParseStrategy(std::string_view name);

// Staging and production only.
bool IsDeployableEnvironment(release::coordinator::v1::Environment environment);

} // namespace release::model
