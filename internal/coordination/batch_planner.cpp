#include "batch_planner.hpp"

#include <cstdint>

namespace release::coordination {

namespace {

struct BatchingVisitor {
  const graph::DependencyGraph& graph;

  std::vector<graph::Batch> operator()(const Sequential&) const {
    std::vector<graph::Batch> batches;
    batches.reserve(graph.input_order.size());
    for (const auto& name : graph.input_order) {
      graph::Batch batch;
      batch.id = static_cast<uint32_t>(batches.size() + 1);
      batch.services.push_back(graph.nodes.at(name));
      if (batch.id > 1) {
        batch.depends_on_batch_ids.push_back(batch.id - 1);
      }
      batches.push_back(std::move(batch));
    }
    return batches;
  }

  std::vector<graph::Batch> operator()(const Parallel&) const {
    graph::Batch batch;
    batch.id = 1;
    batch.services.reserve(graph.input_order.size());
    for (const auto& name : graph.input_order) {
      batch.services.push_back(graph.nodes.at(name));
    }
    return {std::move(batch)};
  }

  std::vector<graph::Batch> operator()(const DependencyOrder&) const {
    return graph::TopologicalSort(graph);
  }
};

struct NameVisitor {
  std::string_view operator()(const Sequential&) const {
    return "sequential";
  }
  std::string_view operator()(const Parallel&) const {
    return "parallel";
  }
  std::string_view operator()(const DependencyOrder&) const {
    return "dependency-order";
  }
};

} // namespace

PlanStrategy FromProto(release::coordinator::v1::Strategy strategy) {
  switch (strategy) {
    case release::coordinator::v1::STRATEGY_SEQUENTIAL:
      return Sequential{};
    case release::coordinator::v1::STRATEGY_PARALLEL:
      return Parallel{};
    default:
      return DependencyOrder{};
  }
}

std::string_view StrategyName(const PlanStrategy& strategy) {
  return std::visit(NameVisitor{}, strategy);
}

std::vector<graph::Batch> PlanBatches(const PlanStrategy& strategy, const graph::DependencyGraph& graph) {
  if (graph.Size() == 0) {
    return {};
  }
  return std::visit(BatchingVisitor{graph}, strategy);
}

} // namespace release::coordination
