#pragma once

#include "release/coordinator/v1/coordinator_service.pb.h"
#include "service_context.hpp"

namespace release::service {

/*
  Transport-neutral implementation of ReleaseCoordinatorService. Errors
  propagate as util exceptions; lookups that find nothing throw
  util::NotFound.
*/
class CoordinatorService {
 public:
  explicit CoordinatorService(ServiceContext ctx);

  release::coordinator::v1::CoordinateReleaseResponse CoordinateRelease(const release::coordinator::v1::CoordinateReleaseRequest& req);

  release::coordinator::v1::GetReleaseResponse GetRelease(const release::coordinator::v1::GetReleaseRequest& req);

  release::coordinator::v1::GetLatestReleaseResponse GetLatestRelease(const release::coordinator::v1::GetLatestReleaseRequest& req);

  release::coordinator::v1::ListReleasesResponse ListReleases(const release::coordinator::v1::ListReleasesRequest& req);

  release::coordinator::v1::GetStatisticsResponse GetStatistics(const release::coordinator::v1::GetStatisticsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace release::service
