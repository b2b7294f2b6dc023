#pragma once

#include <filesystem>
#include <string>

#include "release/coordinator/v1/release.pb.h"

namespace release::notes {

/*
  Produces the release notes for a finished release and returns their path.
  The coordinator embeds the path verbatim and never formats notes content.
*/
class ReleaseNotesGenerator {
 public:
  virtual ~ReleaseNotesGenerator() = default;

  virtual std::string Generate(const release::coordinator::v1::ReleaseRecord& record) = 0;
};

// Lowercase, every character outside [a-z0-9-] replaced by '-'.
std::string SanitizeName(const std::string& name);

/*
  Assigns the conventional location without writing anything:
    <project>/.deployment-registry/release-notes/<env>/<name>-<YYYY-MM-DD>.md
*/
class PathReleaseNotesGenerator final : public ReleaseNotesGenerator {
 public:
  explicit PathReleaseNotesGenerator(std::filesystem::path project_path);

  std::string Generate(const release::coordinator::v1::ReleaseRecord& record) override;

 private:
  std::filesystem::path project_path_;
};

} // namespace release::notes
