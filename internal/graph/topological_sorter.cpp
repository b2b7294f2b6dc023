#include "topological_sorter.hpp"

#include <algorithm>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace release::graph {

std::vector<Batch> TopologicalSort(const DependencyGraph& graph) {
  std::unordered_map<std::string, std::size_t> position;
  std::unordered_map<std::string, std::size_t> in_degree;
  for (std::size_t i = 0; i < graph.input_order.size(); ++i) {
    const auto& name = graph.input_order[i];
    position[name]   = i;
    in_degree[name]  = graph.forward_edges.at(name).size();
  }

  std::vector<std::string> current;
  for (const auto& name : graph.input_order) {
    if (in_degree[name] == 0) {
      current.push_back(name);
    }
  }

  std::vector<Batch>                        batches;
  std::unordered_map<std::string, uint32_t> batch_of;
  std::size_t                               placed = 0;

  while (!current.empty()) {
    Batch batch;
    batch.id = static_cast<uint32_t>(batches.size() + 1);

    std::set<uint32_t> upstream;
    for (const auto& name : current) {
      batch_of[name] = batch.id;
      batch.services.push_back(graph.nodes.at(name));
      for (const auto& dep : graph.forward_edges.at(name)) {
        upstream.insert(batch_of.at(dep));
      }
    }
    batch.depends_on_batch_ids.assign(upstream.begin(), upstream.end());

    std::vector<std::string> next;
    for (const auto& name : current) {
      for (const auto& dependent : graph.reverse_edges.at(name)) {
        if (--in_degree[dependent] == 0) {
          next.push_back(dependent);
        }
      }
    }
    std::sort(next.begin(), next.end(), [&](const std::string& a, const std::string& b) { return position[a] < position[b]; });

    placed += current.size();
    batches.push_back(std::move(batch));
    current = std::move(next);
  }

  if (placed != graph.Size()) {
    std::string residual;
    for (const auto& name : graph.input_order) {
      if (batch_of.count(name) == 0) {
        residual += residual.empty() ? name : ", " + name;
      }
    }
    throw util::ValidationError("Topological sort failed: unprocessed services remain (cycle among: " + residual + ")");
  }

  return batches;
}

} // namespace release::graph
