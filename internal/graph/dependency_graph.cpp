#include "dependency_graph.hpp"

#include <unordered_set>

#include "internal/util/errors.hpp"

namespace release::graph {

namespace {

std::string Join(const std::vector<std::string>& items, const std::string& separator) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += items[i];
  }
  return out;
}

} // namespace

ValidationResult ValidateDependencies(const ServiceList& services) {
  ValidationResult result;

  std::unordered_map<std::string, std::size_t> name_counts;
  std::vector<std::string>                     first_seen;
  for (std::size_t i = 0; i < services.size(); ++i) {
    const auto& name = services[i].name();
    if (name.empty()) {
      result.errors.push_back("Service at position " + std::to_string(i) + " has an empty name");
      continue;
    }
    if (name_counts[name]++ == 0) {
      first_seen.push_back(name);
    }
  }

  for (const auto& name : first_seen) {
    const auto count = name_counts[name];
    if (count > 1) {
      result.errors.push_back("Duplicate service name: '" + name + "' appears " + std::to_string(count) + " times");
    }
  }

  std::unordered_set<std::string> depended_on;
  for (const auto& service : services) {
    bool self_dependency = false;
    for (const auto& dep : service.dependencies()) {
      depended_on.insert(dep);
      if (dep == service.name()) {
        self_dependency = true;
        continue;
      }
      if (name_counts.count(dep) == 0) {
        result.errors.push_back("Service '" + service.name() + "' depends on '" + dep + "', but '" + dep + "' is not defined");
      }
    }
    if (self_dependency) {
      result.errors.push_back("Service '" + service.name() + "' has a self-dependency");
    }
  }

  if (services.size() > 1) {
    for (const auto& service : services) {
      if (service.dependencies_size() == 0 && depended_on.count(service.name()) == 0) {
        result.warnings.push_back("Service '" + service.name() + "' has no dependencies and is not a dependency of any other service");
      }
    }
  }

  result.valid = result.errors.empty();
  return result;
}

DependencyGraph BuildGraph(const ServiceList& services) {
  const auto validation = ValidateDependencies(services);
  if (!validation.valid) {
    throw util::ValidationError("Dependency validation failed: " + Join(validation.errors, "; "));
  }

  DependencyGraph graph;
  graph.input_order.reserve(services.size());

  for (const auto& service : services) {
    graph.nodes.emplace(service.name(), service);
    graph.forward_edges[service.name()];
    graph.reverse_edges[service.name()];
    graph.input_order.push_back(service.name());
  }

  for (const auto& service : services) {
    for (const auto& dep : service.dependencies()) {
      graph.forward_edges[service.name()].insert(dep);
      graph.reverse_edges[dep].insert(service.name());
    }
  }

  return graph;
}

} // namespace release::graph
