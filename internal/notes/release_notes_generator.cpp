#include "release_notes_generator.hpp"

#include "internal/model/names.hpp"
#include "internal/util/time.hpp"

namespace release::notes {

using namespace release::coordinator::v1;

std::string SanitizeName(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
    const bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    out.push_back(keep ? c : '-');
  }
  return out;
}

PathReleaseNotesGenerator::PathReleaseNotesGenerator(std::filesystem::path project_path) : project_path_(std::move(project_path)) {
}

std::string PathReleaseNotesGenerator::Generate(const ReleaseRecord& record) {
  const std::string environment = model::EnvironmentName(record.environment());
  const auto        date        = util::ToDateString(record.has_timestamp() ? util::FromProto(record.timestamp()) : util::Now());

  const auto path =
      project_path_ / ".deployment-registry" / "release-notes" / environment / (SanitizeName(record.release_name()) + "-" + date + ".md");
  return path.string();
}

} // namespace release::notes
