#pragma once

#include "release/coordinator/v1/types.pb.h"

namespace release::model {

using release::coordinator::v1::ReleaseStatus;

constexpr bool IsTerminal(ReleaseStatus status) {
  return status == release::coordinator::v1::RELEASE_STATUS_SUCCESS || status == release::coordinator::v1::RELEASE_STATUS_FAILED ||
         status == release::coordinator::v1::RELEASE_STATUS_ROLLED_BACK;
}

/*
  pending -> in-progress -> {success | failed | rolled-back}

  pending may jump straight to a terminal state. Non-terminal states may be
  re-entered (batch-by-batch updates). Terminal states are final.
*/
constexpr bool CanTransition(ReleaseStatus from, ReleaseStatus to) {
  if (to == release::coordinator::v1::RELEASE_STATUS_UNSPECIFIED) {
    return false;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (from == to) {
    return true;
  }
  if (from == release::coordinator::v1::RELEASE_STATUS_UNSPECIFIED) {
    return true;
  }

  // No way back to pending once started.
  return to != release::coordinator::v1::RELEASE_STATUS_PENDING;
}

} // namespace release::model
