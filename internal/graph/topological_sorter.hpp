#pragma once

#include <cstdint>
#include <vector>

#include "dependency_graph.hpp"

namespace release::graph {

struct Batch {
  // 1-based position in the plan.
  uint32_t                        id = 0;
  std::vector<ServiceDeclaration> services;
  std::vector<uint32_t>           depends_on_batch_ids;
};

/*
  Kahn's algorithm, level by level. Each batch holds every service whose
  dependencies all sit in earlier batches, in declaration order.

  The graph must be acyclic. Nodes left over when no zero in-degree node
  remains raise util::ValidationError; a partial order is never returned.
*/
std::vector<Batch> TopologicalSort(const DependencyGraph& graph);

} // namespace release::graph
