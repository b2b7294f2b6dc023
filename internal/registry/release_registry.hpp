#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "release/coordinator/v1/release.pb.h"
#include "release/coordinator/v1/types.pb.h"

namespace release::registry {

/*
  Partial update of a stored release. Unset fields keep their stored value.
*/
struct ReleaseUpdate {
  std::optional<release::coordinator::v1::ReleaseStatus>              status;
  std::optional<std::vector<std::string>>                             deployment_order;
  std::optional<std::vector<release::coordinator::v1::ServiceResult>> service_results;
  std::optional<uint64_t>                                             duration_ms;
  std::optional<release::coordinator::v1::HealthStatus>               overall_health;
  std::optional<std::string>                                          release_notes_path;
};

/*
  Durable release history.

  Backing store is one JSON document (protobuf JSON of RegistryDocument) at
    <project>/.deployment-registry/releases.json

  Every mutation is a full read-modify-write of that document, serialized by
  an internal mutex and published with write tmp -> fsync -> rename, so
  readers never observe a half-written file.

  I/O and parse failures raise util::RegistryError. Statistics are derived
  from the stored records on every call.
*/
class ReleaseRegistry {
 public:
  static constexpr const char* kDocumentVersion = "1.0.0";

  explicit ReleaseRegistry(std::filesystem::path project_path);

  // Creates the directory and an empty document if absent.
  void Initialize();

  // Throws util::AlreadyExists when the id is taken.
  void AddRelease(const release::coordinator::v1::ReleaseRecord& record);

  // Throws util::NotFound for an unknown id and util::InvalidState for a
  // status change the release state machine forbids.
  void UpdateRelease(const std::string& release_id, const ReleaseUpdate& update);

  std::optional<release::coordinator::v1::ReleaseRecord> GetRelease(const std::string& release_id) const;

  // Most recent by timestamp.
  std::optional<release::coordinator::v1::ReleaseRecord> GetLatestRelease(release::coordinator::v1::Environment environment) const;

  // UNSPECIFIED filters match everything.
  std::vector<release::coordinator::v1::ReleaseRecord> ListReleases(
      release::coordinator::v1::Environment   environment = release::coordinator::v1::ENVIRONMENT_UNSPECIFIED,
      release::coordinator::v1::ReleaseStatus status      = release::coordinator::v1::RELEASE_STATUS_UNSPECIFIED) const;

  release::coordinator::v1::ReleaseStatistics GetStatistics(
      release::coordinator::v1::Environment environment = release::coordinator::v1::ENVIRONMENT_UNSPECIFIED) const;

  // release-<sanitized name, max 20 chars>-<unix millis>-<6 hex chars>
  static std::string GenerateReleaseId(const std::string& release_name);

  const std::filesystem::path& RegistryPath() const {
    return registry_path_;
  }

 private:
  release::coordinator::v1::RegistryDocument LoadLocked() const;
  void                                       SaveLocked(release::coordinator::v1::RegistryDocument& document) const;

  std::filesystem::path project_path_;
  std::filesystem::path registry_path_;

  mutable std::mutex mutex_;
};

} // namespace release::registry
