#pragma once

#include "release/coordinator/v1/types.pb.h"
#include "release/coordinator/v1/release.pb.h"
#include "release/coordinator/v1/coordinator_service.pb.h"
#include "release/coordinator/v1/agent_service.pb.h"
