#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "client/cpp/release_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/model/names.hpp"

using namespace release::coordinator::v1;
using release::coordinator::client::ReleaseClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  releasectl <addr> coordinate <request.yaml>\n"
            << "  releasectl <addr> get <release_id>\n"
            << "  releasectl <addr> latest <staging|production>\n"
            << "  releasectl <addr> list [staging|production]\n"
            << "  releasectl <addr> stats [staging|production]\n";
}

static bool ParseEnvironmentArg(const std::string& arg, Environment* out) {
  auto parsed = release::model::ParseEnvironment(arg);
  if (!parsed) {
    std::cerr << "invalid environment '" << arg << "' (expected staging or production)\n";
    return false;
  }
  *out = *parsed;
  return true;
}

static int PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot print response: " << status.message() << "\n";
    return 1;
  }
  std::cout << json;
  return 0;
}

static void PrintRecordLine(const ReleaseRecord& record) {
  std::cout << record.release_id() << "  " << release::model::EnvironmentName(record.environment()) << "  "
            << release::model::ReleaseStatusName(record.status()) << "  " << release::model::HealthStatusName(record.overall_health()) << "  "
            << record.duration_ms() << "ms  " << record.release_name() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  // Coordination waits for every batch.
  ReleaseClient client(channel, cmd == "coordinate" ? std::chrono::milliseconds{0} : std::chrono::milliseconds{10000});

  if (cmd == "coordinate") {
    if (argc != 4) {
      Usage();
      return 1;
    }

    CoordinateReleaseRequest req;
    try {
      req = release::config::ConfigLoader::LoadReleaseRequest(argv[3]);
    } catch (const std::exception& e) {
      std::cerr << e.what() << "\n";
      return 1;
    }

    CoordinateReleaseResponse resp;
    auto                      status = client.CoordinateRelease(req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    const auto& summary = resp.summary();
    std::cout << "release_id=" << resp.release_id() << "\n"
              << "success=" << (resp.success() ? "true" : "false") << "\n"
              << "health=" << release::model::HealthStatusName(resp.overall_health()) << "\n"
              << "deployed=" << summary.deployed() << " failed=" << summary.failed() << " rolled_back=" << summary.rolled_back()
              << " skipped=" << summary.skipped() << " duration_ms=" << summary.duration_ms() << "\n";
    for (const auto& result : resp.service_results()) {
      std::cout << "  " << std::left << std::setw(24) << result.service() << " " << std::setw(12)
                << release::model::ServiceStatusName(result.status()) << " " << result.message() << "\n";
    }
    if (!resp.release_notes().empty()) {
      std::cout << "release_notes=" << resp.release_notes() << "\n";
    }
    if (!resp.registry_error().empty()) {
      std::cerr << "warning: release not persisted: " << resp.registry_error() << "\n";
    }
    return resp.success() ? 0 : 2;
  }

  if (cmd == "get") {
    if (argc != 4) {
      Usage();
      return 1;
    }
    ReleaseRecord record;
    auto          status = client.GetRelease(argv[3], &record);
    return status.ok() ? PrintJson(record) : Fail(status);
  }

  if (cmd == "latest") {
    Environment environment;
    if (argc != 4 || !ParseEnvironmentArg(argv[3], &environment)) {
      Usage();
      return 1;
    }
    ReleaseRecord record;
    auto          status = client.GetLatestRelease(environment, &record);
    return status.ok() ? PrintJson(record) : Fail(status);
  }

  if (cmd == "list" || cmd == "stats") {
    Environment environment = ENVIRONMENT_UNSPECIFIED;
    if (argc > 4 || (argc == 4 && !ParseEnvironmentArg(argv[3], &environment))) {
      Usage();
      return 1;
    }

    if (cmd == "stats") {
      ReleaseStatistics stats;
      auto              status = client.GetStatistics(environment, &stats);
      return status.ok() ? PrintJson(stats) : Fail(status);
    }

    std::vector<ReleaseRecord> records;
    auto                       status = client.ListReleases(environment, RELEASE_STATUS_UNSPECIFIED, &records);
    if (!status.ok()) {
      return Fail(status);
    }
    for (const auto& record : records) {
      PrintRecordLine(record);
    }
    return 0;
  }

  Usage();
  return 1;
}
