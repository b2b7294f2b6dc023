#pragma once

#include <string_view>
#include <variant>
#include <vector>

#include "internal/graph/dependency_graph.hpp"
#include "internal/graph/topological_sorter.hpp"
#include "release/coordinator/v1/types.pb.h"

namespace release::coordination {

// One service per batch, declaration order.
struct Sequential {};
// Every service in a single batch.
struct Parallel {};
// Topological levels.
struct DependencyOrder {};

using PlanStrategy = std::variant<Sequential, Parallel, DependencyOrder>;

PlanStrategy     FromProto(release::coordinator::v1::Strategy strategy);
std::string_view StrategyName(const PlanStrategy& strategy);

/*
  Splits a validated, acyclic graph into execution batches. Only
  DependencyOrder uses the edges; the other strategies keep declaration
  order.
*/
std::vector<graph::Batch> PlanBatches(const PlanStrategy& strategy, const graph::DependencyGraph& graph);

} // namespace release::coordination
