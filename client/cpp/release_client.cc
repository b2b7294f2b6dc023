#include "client/cpp/release_client.h"

#include <grpcpp/client_context.h>

#include <utility>

namespace release::coordinator::client {

using namespace release::coordinator::v1;

ReleaseClient::ReleaseClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(ReleaseCoordinatorService::NewStub(std::move(channel))), deadline_(deadline) {
}

void ReleaseClient::PrepareContext(::grpc::ClientContext* ctx) const {
  if (deadline_.count() > 0) {
    ctx->set_deadline(std::chrono::system_clock::now() + deadline_);
  }
}

::grpc::Status ReleaseClient::CoordinateRelease(const CoordinateReleaseRequest& request, CoordinateReleaseResponse* out) const {
  ::grpc::ClientContext ctx;
  PrepareContext(&ctx);
  return stub_->CoordinateRelease(&ctx, request, out);
}

::grpc::Status ReleaseClient::GetRelease(const std::string& release_id, ReleaseRecord* out) const {
  ::grpc::ClientContext ctx;
  PrepareContext(&ctx);

  GetReleaseRequest  req;
  GetReleaseResponse resp;
  req.set_release_id(release_id);

  auto status = stub_->GetRelease(&ctx, req, &resp);
  if (status.ok()) {
    *out = std::move(*resp.mutable_release());
  }
  return status;
}

::grpc::Status ReleaseClient::GetLatestRelease(Environment environment, ReleaseRecord* out) const {
  ::grpc::ClientContext ctx;
  PrepareContext(&ctx);

  GetLatestReleaseRequest  req;
  GetLatestReleaseResponse resp;
  req.set_environment(environment);

  auto status = stub_->GetLatestRelease(&ctx, req, &resp);
  if (status.ok()) {
    *out = std::move(*resp.mutable_release());
  }
  return status;
}

::grpc::Status ReleaseClient::ListReleases(Environment environment, ReleaseStatus release_status, std::vector<ReleaseRecord>* out) const {
  ::grpc::ClientContext ctx;
  PrepareContext(&ctx);

  ListReleasesRequest  req;
  ListReleasesResponse resp;
  req.set_environment(environment);
  req.set_status(release_status);

  auto status = stub_->ListReleases(&ctx, req, &resp);
  if (status.ok()) {
    out->assign(resp.releases().begin(), resp.releases().end());
  }
  return status;
}

::grpc::Status ReleaseClient::GetStatistics(Environment environment, ReleaseStatistics* out) const {
  ::grpc::ClientContext ctx;
  PrepareContext(&ctx);

  GetStatisticsRequest  req;
  GetStatisticsResponse resp;
  req.set_environment(environment);

  auto status = stub_->GetStatistics(&ctx, req, &resp);
  if (status.ok()) {
    *out = std::move(*resp.mutable_statistics());
  }
  return status;
}

} // namespace release::coordinator::client
