#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/coordinator_service.hpp"
#include "release/coordinator/v1/coordinator_service.grpc.pb.h"

namespace release::grpc {

class CoordinatorServer final : public release::coordinator::v1::ReleaseCoordinatorService::Service {
 public:
  explicit CoordinatorServer(std::shared_ptr<release::service::CoordinatorService> svc);

  ::grpc::Status CoordinateRelease(::grpc::ServerContext*, const release::coordinator::v1::CoordinateReleaseRequest*,
                                   release::coordinator::v1::CoordinateReleaseResponse*) override;

  ::grpc::Status GetRelease(::grpc::ServerContext*, const release::coordinator::v1::GetReleaseRequest*,
                            release::coordinator::v1::GetReleaseResponse*) override;

  ::grpc::Status GetLatestRelease(::grpc::ServerContext*, const release::coordinator::v1::GetLatestReleaseRequest*,
                                  release::coordinator::v1::GetLatestReleaseResponse*) override;

  ::grpc::Status ListReleases(::grpc::ServerContext*, const release::coordinator::v1::ListReleasesRequest*,
                              release::coordinator::v1::ListReleasesResponse*) override;

  ::grpc::Status GetStatistics(::grpc::ServerContext*, const release::coordinator::v1::GetStatisticsRequest*,
                               release::coordinator::v1::GetStatisticsResponse*) override;

 private:
  std::shared_ptr<release::service::CoordinatorService> service_;
};

} // namespace release::grpc
