#pragma once

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "release/coordinator/v1/types.pb.h"

namespace release::graph {

using release::coordinator::v1::ServiceDeclaration;

using ServiceList = std::vector<ServiceDeclaration>;
using EdgeSet     = std::set<std::string>;

/*
  Name-keyed service graph. Nodes never point at each other; every edge is a
  pair of names, and both edge maps hold an entry (possibly empty) for every
  node.

    forward_edges[a] = services a depends on
    reverse_edges[b] = services depending on b
*/
struct DependencyGraph {
  std::unordered_map<std::string, ServiceDeclaration> nodes;
  std::unordered_map<std::string, EdgeSet>            forward_edges;
  std::unordered_map<std::string, EdgeSet>            reverse_edges;

  // Declaration order of the request; used to break ties deterministically.
  std::vector<std::string> input_order;

  bool Contains(const std::string& name) const {
    return nodes.count(name) > 0;
  }

  std::size_t Size() const {
    return nodes.size();
  }
};

struct ValidationResult {
  bool                     valid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

/*
  Reports every duplicate name, missing dependency and self-dependency in one
  pass, without throwing. Output depends only on the input.
*/
ValidationResult ValidateDependencies(const ServiceList& services);

/*
  Builds the graph. Throws util::ValidationError naming every offending
  service when the declarations do not form a well-formed graph.
*/
DependencyGraph BuildGraph(const ServiceList& services);

} // namespace release::graph
