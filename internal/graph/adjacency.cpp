#include "internal/graph/adjacency.hpp"

namespace impact::graph {

Adjacency BuildForwardAdjacency(const impact::v1::Dependencies& dependencies, const NodeSet* allowed_ids) {
  Adjacency adjacency;

  for (const auto& dependency : dependencies) {
    if (allowed_ids) {
      if (!allowed_ids->contains(dependency.source_id()) || !allowed_ids->contains(dependency.target_id())) {
        continue;
      }
    }
    adjacency[dependency.source_id()].push_back(dependency.target_id());
  }

  return adjacency;
}

const std::vector<NodeId>& Successors(const Adjacency& adjacency, const NodeId& id) {
  static const std::vector<NodeId> kNone;

  auto it = adjacency.find(id);
  if (it == adjacency.end()) {
    return kNone;
  }
  return it->second;
}

} // namespace impact::graph
