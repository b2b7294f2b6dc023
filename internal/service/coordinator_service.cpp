#include "coordinator_service.hpp"

#include <chrono>
#include <utility>

#include "internal/coordination/release_coordinator.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/release_registry.hpp"
#include "internal/util/errors.hpp"

namespace release::service {

using namespace release::coordinator::v1;
using observability::DurationField;
using observability::StringField;

namespace {

// Span, latency and error logging around one RPC body.
template <typename Fn>
auto ObserveRpc(const char* route, Fn&& fn) -> decltype(fn(std::declval<observability::SpanScope&>())) {
  observability::SpanScope span(route);
  const auto               started_at = std::chrono::steady_clock::now();
  auto                     elapsed = [&]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at);
  };

  try {
    auto resp = fn(span);
    RELEASE_LOG_DEBUG("RPC completed", {StringField("route", route), DurationField("latency", elapsed())});
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RELEASE_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what()), DurationField("latency", elapsed())});
    throw;
  }
}

// UNSPECIFIED is a valid "any environment" filter; other values must be known.
void RequireKnownEnvironment(Environment environment, bool allow_unspecified) {
  if (allow_unspecified && environment == ENVIRONMENT_UNSPECIFIED) {
    return;
  }
  if (!model::IsDeployableEnvironment(environment)) {
    throw util::ValidationError("Invalid environment " + std::to_string(static_cast<int>(environment)) + ": expected staging or production");
  }
}

} // namespace

CoordinatorService::CoordinatorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CoordinateReleaseResponse CoordinatorService::CoordinateRelease(const CoordinateReleaseRequest& req) {
  return ObserveRpc("CoordinatorService.CoordinateRelease", [&](observability::SpanScope& span) {
    auto resp = ctx_.coordinator->CoordinateRelease(req);
    span.SetAttribute("release.id", resp.release_id());
    return resp;
  });
}

GetReleaseResponse CoordinatorService::GetRelease(const GetReleaseRequest& req) {
  return ObserveRpc("CoordinatorService.GetRelease", [&](observability::SpanScope& span) {
    if (req.release_id().empty()) {
      throw util::ValidationError("release_id is required");
    }
    span.SetAttribute("release.id", req.release_id());

    auto record = ctx_.registry->GetRelease(req.release_id());
    if (!record) {
      throw util::NotFound("release not found: " + req.release_id());
    }

    GetReleaseResponse resp;
    *resp.mutable_release() = std::move(*record);
    return resp;
  });
}

GetLatestReleaseResponse CoordinatorService::GetLatestRelease(const GetLatestReleaseRequest& req) {
  return ObserveRpc("CoordinatorService.GetLatestRelease", [&](observability::SpanScope& span) {
    RequireKnownEnvironment(req.environment(), false);
    span.SetAttribute("release.environment", model::EnvironmentName(req.environment()));

    auto record = ctx_.registry->GetLatestRelease(req.environment());
    if (!record) {
      throw util::NotFound("no releases for environment " + model::EnvironmentName(req.environment()));
    }

    GetLatestReleaseResponse resp;
    *resp.mutable_release() = std::move(*record);
    return resp;
  });
}

ListReleasesResponse CoordinatorService::ListReleases(const ListReleasesRequest& req) {
  return ObserveRpc("CoordinatorService.ListReleases", [&](observability::SpanScope& span) {
    RequireKnownEnvironment(req.environment(), true);

    ListReleasesResponse resp;
    for (auto& record : ctx_.registry->ListReleases(req.environment(), req.status())) {
      *resp.add_releases() = std::move(record);
    }
    span.SetAttribute("releases", static_cast<std::int64_t>(resp.releases_size()));
    return resp;
  });
}

GetStatisticsResponse CoordinatorService::GetStatistics(const GetStatisticsRequest& req) {
  return ObserveRpc("CoordinatorService.GetStatistics", [&](observability::SpanScope&) {
    RequireKnownEnvironment(req.environment(), true);

    GetStatisticsResponse resp;
    *resp.mutable_statistics() = ctx_.registry->GetStatistics(req.environment());
    return resp;
  });
}

} // namespace release::service
