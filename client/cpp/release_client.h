#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "release/coordinator/v1.hpp"
#include "release/coordinator/v1/coordinator_service.grpc.pb.h"

namespace release::coordinator::client {

/*
  Blocking client for ReleaseCoordinatorService.

  Every call returns the RPC status and fills `out` only on success. A
  non-zero deadline bounds each call; CoordinateRelease usually needs a
  generous one because it waits for the whole release.
*/
class ReleaseClient {
 public:
  explicit ReleaseClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline = std::chrono::milliseconds{0});

  ::grpc::Status CoordinateRelease(const release::coordinator::v1::CoordinateReleaseRequest& request,
                                   release::coordinator::v1::CoordinateReleaseResponse*      out) const;

  ::grpc::Status GetRelease(const std::string& release_id, release::coordinator::v1::ReleaseRecord* out) const;

  ::grpc::Status GetLatestRelease(release::coordinator::v1::Environment environment, release::coordinator::v1::ReleaseRecord* out) const;

  ::grpc::Status ListReleases(release::coordinator::v1::Environment environment, release::coordinator::v1::ReleaseStatus status,
                              std::vector<release::coordinator::v1::ReleaseRecord>* out) const;

  ::grpc::Status GetStatistics(release::coordinator::v1::Environment environment, release::coordinator::v1::ReleaseStatistics* out) const;

 private:
  void PrepareContext(::grpc::ClientContext* ctx) const;

  std::unique_ptr<release::coordinator::v1::ReleaseCoordinatorService::Stub> stub_;
  std::chrono::milliseconds                                                  deadline_;
};

} // namespace release::coordinator::client
