#include "coordinator_server.hpp"

#include "grpc_error.hpp"

namespace release::grpc {

using namespace release::coordinator::v1;

namespace {

template <typename Fn>
::grpc::Status Dispatch(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

CoordinatorServer::CoordinatorServer(std::shared_ptr<release::service::CoordinatorService> svc) : service_(std::move(svc)) {
}

::grpc::Status CoordinatorServer::CoordinateRelease(::grpc::ServerContext*, const CoordinateReleaseRequest* req, CoordinateReleaseResponse* resp) {
  return Dispatch([&] { *resp = service_->CoordinateRelease(*req); });
}

::grpc::Status CoordinatorServer::GetRelease(::grpc::ServerContext*, const GetReleaseRequest* req, GetReleaseResponse* resp) {
  return Dispatch([&] { *resp = service_->GetRelease(*req); });
}

::grpc::Status CoordinatorServer::GetLatestRelease(::grpc::ServerContext*, const GetLatestReleaseRequest* req, GetLatestReleaseResponse* resp) {
  return Dispatch([&] { *resp = service_->GetLatestRelease(*req); });
}

::grpc::Status CoordinatorServer::ListReleases(::grpc::ServerContext*, const ListReleasesRequest* req, ListReleasesResponse* resp) {
  return Dispatch([&] { *resp = service_->ListReleases(*req); });
}

::grpc::Status CoordinatorServer::GetStatistics(::grpc::ServerContext*, const GetStatisticsRequest* req, GetStatisticsResponse* resp) {
  return Dispatch([&] { *resp = service_->GetStatistics(*req); });
}

} // namespace release::grpc
