#include "internal/graph/propagation.hpp"

#include <queue>

namespace impact::graph {

using namespace impact::v1;

NodeSet TraverseDownstream(const std::vector<NodeId>& roots, const Adjacency& adjacency, const NodeSet* stop_set) {
  NodeSet impacted;
  if (roots.empty()) {
    return impacted;
  }

  NodeSet            visited(roots.begin(), roots.end());
  std::queue<NodeId> q;
  for (const auto& root : roots) {
    q.push(root);
  }

  while (!q.empty()) {
    const auto node = q.front();
    q.pop();

    for (const auto& next : Successors(adjacency, node)) {
      if (!visited.insert(next).second) {
        continue;
      }

      if (stop_set && stop_set->contains(next)) {
        continue;
      }

      impacted.insert(next);
      q.push(next);
    }
  }

  return impacted;
}

std::vector<NodeId> OfflineRoots(const Components& components) {
  std::vector<NodeId> roots;
  for (const auto& component : components) {
    if (component.status() == COMPONENT_STATUS_OFFLINE) {
      roots.push_back(component.id());
    }
  }
  return roots;
}

NodeSet ComputeDownstreamImpact(const Components& components, const Dependencies& dependencies, const NodeSet* visible_ids) {
  const auto roots = OfflineRoots(components);
  if (roots.empty()) {
    return {};
  }

  const NodeSet root_set(roots.begin(), roots.end());
  const auto    adjacency = BuildForwardAdjacency(dependencies, visible_ids);
  return TraverseDownstream(roots, adjacency, &root_set);
}

std::vector<std::pair<NodeId, std::uint32_t>> ReachableWithDepth(const NodeId& start, const Adjacency& adjacency) {
  std::vector<std::pair<NodeId, std::uint32_t>> reached;

  std::queue<std::pair<NodeId, std::uint32_t>> q;
  NodeSet                                      visited;

  q.emplace(start, 0);
  visited.insert(start);

  while (!q.empty()) {
    auto [node, depth] = q.front();
    q.pop();

    for (const auto& next : Successors(adjacency, node)) {
      if (!visited.insert(next).second) {
        continue;
      }
      reached.emplace_back(next, depth + 1);
      q.emplace(next, depth + 1);
    }
  }

  return reached;
}

} // namespace impact::graph
