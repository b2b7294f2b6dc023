#include "cycle_detector.hpp"

#include <algorithm>
#include <unordered_map>

namespace release::graph {

namespace {

enum class Mark { kUnvisited, kOnStack, kDone };

struct Frame {
  std::string             node;
  EdgeSet::const_iterator next;
  EdgeSet::const_iterator end;
};

} // namespace

std::vector<CyclePath> DetectCycles(const DependencyGraph& graph) {
  std::vector<CyclePath>                cycles;
  std::unordered_map<std::string, Mark> marks;
  std::vector<Frame>                    stack;
  std::vector<std::string>              path;

  auto push = [&](const std::string& node) {
    marks[node]       = Mark::kOnStack;
    const auto& edges = graph.forward_edges.at(node);
    path.push_back(node);
    stack.push_back(Frame{node, edges.begin(), edges.end()});
  };

  for (const auto& start : graph.input_order) {
    if (marks[start] != Mark::kUnvisited) {
      continue;
    }

    push(start);
    while (!stack.empty()) {
      auto& frame = stack.back();
      if (frame.next == frame.end) {
        marks[frame.node] = Mark::kDone;
        path.pop_back();
        stack.pop_back();
        continue;
      }

      const std::string& dep = *frame.next;
      ++frame.next;

      const auto mark = marks[dep];
      if (mark == Mark::kUnvisited) {
        push(dep);
      } else if (mark == Mark::kOnStack) {
        auto      cycle_start = std::find(path.begin(), path.end(), dep);
        CyclePath cycle(cycle_start, path.end());
        cycle.push_back(dep);
        cycles.push_back(std::move(cycle));
      }
    }
  }

  return cycles;
}

std::string DescribeCycle(const CyclePath& cycle) {
  std::string out;
  for (std::size_t i = 0; i < cycle.size(); ++i) {
    if (i > 0) {
      out += " -> ";
    }
    out += cycle[i];
  }
  return out;
}

} // namespace release::graph
