#pragma once

#include <string>

#include "config/config.pb.h"
#include "release/coordinator/v1/coordinator_service.pb.h"

namespace release::config {

/*
  YAML front end for protobuf messages.

  The document is converted to a google.protobuf.Value, printed as JSON and
  parsed into the target message. Unknown keys are errors. Quoted scalars
  always stay strings; plain scalars become numbers or booleans when they
  parse as such.
*/
class ConfigLoader {
 public:
  static release::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Release request file for releasectl. `environment` and `strategy` accept
  // the lowercase names ("staging", "dependency-order").
  static release::coordinator::v1::CoordinateReleaseRequest LoadReleaseRequest(const std::string& path);
};

} // namespace release::config
