#pragma once

#include <string>
#include <vector>

#include "dependency_graph.hpp"

namespace release::graph {

// Closed path, first name repeated at the end: {A, B, C, A}.
using CyclePath = std::vector<std::string>;

/*
  Depth-first search over forward edges with an explicit stack. Every back
  edge found yields one cycle, and the search restarts from each unvisited
  node in declaration order, so disjoint cycles are all reported.
*/
std::vector<CyclePath> DetectCycles(const DependencyGraph& graph);

// "A -> B -> C -> A"
std::string DescribeCycle(const CyclePath& cycle);

} // namespace release::graph
