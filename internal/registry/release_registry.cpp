#include "release_registry.hpp"

#include <google/protobuf/util/json_util.h>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/model/state_machine.hpp"
#include "internal/notes/release_notes_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace release::registry {

using namespace release::coordinator::v1;

namespace {

bool Matches(const ReleaseRecord& record, Environment environment) {
  return environment == ENVIRONMENT_UNSPECIFIED || record.environment() == environment;
}

void WriteAll(int fd, const std::string& data, const std::filesystem::path& path) {
  const char* p         = data.data();
  std::size_t remaining = data.size();
  while (remaining > 0) {
    const ssize_t n = ::write(fd, p, remaining);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw util::RegistryError("write " + path.string() + " failed: " + std::strerror(errno));
    }
    p += n;
    remaining -= static_cast<std::size_t>(n);
  }
}

// Best effort cleanup on a path that already failed.
void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

ReleaseRegistry::ReleaseRegistry(std::filesystem::path project_path)
    : project_path_(std::move(project_path)), registry_path_(project_path_ / ".deployment-registry" / "releases.json") {
}

void ReleaseRegistry::Initialize() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::error_code ec;
  std::filesystem::create_directories(registry_path_.parent_path(), ec);
  if (ec) {
    throw util::RegistryError("cannot create registry directory " + registry_path_.parent_path().string() + ": " + ec.message());
  }

  if (std::filesystem::exists(registry_path_, ec)) {
    // Fail early on an unreadable document rather than on the first release.
    (void)LoadLocked();
    return;
  }

  RegistryDocument document;
  document.set_version(kDocumentVersion);
  document.set_project_path(project_path_.string());
  SaveLocked(document);

  RELEASE_LOG_INFO("Release registry created", {observability::StringField("path", registry_path_.string())});
}

void ReleaseRegistry::AddRelease(const ReleaseRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto document = LoadLocked();
  for (const auto& existing : document.releases()) {
    if (existing.release_id() == record.release_id()) {
      throw util::AlreadyExists("release '" + record.release_id() + "' already exists in registry");
    }
  }

  *document.add_releases() = record;
  SaveLocked(document);
}

void ReleaseRegistry::UpdateRelease(const std::string& release_id, const ReleaseUpdate& update) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto           document = LoadLocked();
  ReleaseRecord* record   = nullptr;
  for (auto& existing : *document.mutable_releases()) {
    if (existing.release_id() == release_id) {
      record = &existing;
      break;
    }
  }
  if (!record) {
    throw util::NotFound("release '" + release_id + "' not found in registry");
  }

  if (update.status) {
    if (!model::CanTransition(record->status(), *update.status)) {
      throw util::InvalidState("release '" + release_id + "' cannot move from " + ReleaseStatus_Name(record->status()) + " to " +
                               ReleaseStatus_Name(*update.status));
    }
    record->set_status(*update.status);
  } else if (model::IsTerminal(record->status())) {
    throw util::InvalidState("release '" + release_id + "' is final (" + ReleaseStatus_Name(record->status()) + ")");
  }

  if (update.deployment_order) {
    record->clear_deployment_order();
    for (const auto& name : *update.deployment_order) {
      record->add_deployment_order(name);
    }
  }
  if (update.service_results) {
    record->clear_service_results();
    for (const auto& result : *update.service_results) {
      *record->add_service_results() = result;
    }
  }
  if (update.duration_ms) {
    record->set_duration_ms(*update.duration_ms);
  }
  if (update.overall_health) {
    record->set_overall_health(*update.overall_health);
  }
  if (update.release_notes_path) {
    record->set_release_notes_path(*update.release_notes_path);
  }

  SaveLocked(document);
}

std::optional<ReleaseRecord> ReleaseRegistry::GetRelease(const std::string& release_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto document = LoadLocked();
  for (const auto& record : document.releases()) {
    if (record.release_id() == release_id) {
      return record;
    }
  }
  return std::nullopt;
}

std::optional<ReleaseRecord> ReleaseRegistry::GetLatestRelease(Environment environment) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto           document = LoadLocked();
  const ReleaseRecord* latest   = nullptr;
  for (const auto& record : document.releases()) {
    if (!Matches(record, environment)) {
      continue;
    }
    // Later entries win ties; the document is append-only.
    if (!latest || util::FromProto(record.timestamp()) >= util::FromProto(latest->timestamp())) {
      latest = &record;
    }
  }

  if (!latest) {
    return std::nullopt;
  }
  return *latest;
}

std::vector<ReleaseRecord> ReleaseRegistry::ListReleases(Environment environment, ReleaseStatus status) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto                 document = LoadLocked();
  std::vector<ReleaseRecord> out;
  for (const auto& record : document.releases()) {
    if (!Matches(record, environment)) {
      continue;
    }
    if (status != RELEASE_STATUS_UNSPECIFIED && record.status() != status) {
      continue;
    }
    out.push_back(record);
  }
  return out;
}

ReleaseStatistics ReleaseRegistry::GetStatistics(Environment environment) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto        document = LoadLocked();
  ReleaseStatistics stats;
  uint64_t          total_duration_ms = 0;

  for (const auto& record : document.releases()) {
    if (!Matches(record, environment)) {
      continue;
    }
    stats.set_total(stats.total() + 1);
    total_duration_ms += record.duration_ms();

    switch (record.status()) {
      case RELEASE_STATUS_SUCCESS:
        stats.set_successful(stats.successful() + 1);
        break;
      case RELEASE_STATUS_FAILED:
        stats.set_failed(stats.failed() + 1);
        break;
      case RELEASE_STATUS_ROLLED_BACK:
        stats.set_rolled_back(stats.rolled_back() + 1);
        break;
      case RELEASE_STATUS_IN_PROGRESS:
        stats.set_in_progress(stats.in_progress() + 1);
        break;
      default:
        break;
    }
  }

  if (stats.total() > 0) {
    stats.set_success_rate(static_cast<double>(stats.successful()) / stats.total());
    stats.set_average_duration_ms(static_cast<double>(total_duration_ms) / stats.total());
  }
  return stats;
}

std::string ReleaseRegistry::GenerateReleaseId(const std::string& release_name) {
  const auto sanitized = notes::SanitizeName(release_name).substr(0, 20);
  return "release-" + sanitized + "-" + std::to_string(util::ToUnixMillis(util::Now())) + "-" + util::ShortHex(util::GenerateUUID(), 3);
}

RegistryDocument ReleaseRegistry::LoadLocked() const {
  std::ifstream in(registry_path_);
  if (!in) {
    throw util::RegistryError("failed to open release registry " + registry_path_.string());
  }

  std::ostringstream content;
  content << in.rdbuf();
  if (in.bad()) {
    throw util::RegistryError("failed to read release registry " + registry_path_.string());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  RegistryDocument document;
  auto             status = google::protobuf::util::JsonStringToMessage(content.str(), &document, options);
  if (!status.ok()) {
    throw util::RegistryError("corrupt release registry " + registry_path_.string() + ": " + std::string(status.message()));
  }
  return document;
}

/*
  Atomic publish:
      write tmp -> fsync -> rename
*/
void ReleaseRegistry::SaveLocked(RegistryDocument& document) const {
  *document.mutable_last_updated() = util::ToProto(util::Now());

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document, &json, options);
  if (!status.ok()) {
    throw util::RegistryError("failed to serialize release registry: " + std::string(status.message()));
  }

  const auto tmp_path = registry_path_.string() + ".tmp";

  int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw util::RegistryError("open " + tmp_path + " failed: " + std::strerror(errno));
  }

  try {
    WriteAll(fd, json, tmp_path);
    if (::fsync(fd) != 0) {
      throw util::RegistryError("fsync " + tmp_path + " failed: " + std::strerror(errno));
    }
  } catch (const util::RegistryError&) {
    ::close(fd);
    RemoveQuietly(tmp_path);
    throw;
  }

  if (::close(fd) != 0) {
    RemoveQuietly(tmp_path);
    throw util::RegistryError("close " + tmp_path + " failed: " + std::strerror(errno));
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, registry_path_, ec);
  if (ec) {
    RemoveQuietly(tmp_path);
    throw util::RegistryError("rename " + tmp_path + " -> " + registry_path_.string() + " failed: " + ec.message());
  }
}

} // namespace release::registry
