#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "internal/graph/adjacency.hpp"

namespace impact::graph {

/*
  Downstream propagation.

  Multi-source BFS over forward adjacency. The visited set is seeded with
  the roots, so a root is never reported as impacted, and every node is
  expanded at most once (cycles and self-loops terminate).

  Members of stop_set are marked visited but neither reported nor
  expanded.
*/
NodeSet TraverseDownstream(const std::vector<NodeId>& roots, const Adjacency& adjacency, const NodeSet* stop_set = nullptr);

// Ids of all offline components, in snapshot order.
std::vector<NodeId> OfflineRoots(const impact::v1::Components& components);

/*
  Impacted set for the current snapshot: roots are all offline components,
  the stop set is the root set itself.
*/
NodeSet ComputeDownstreamImpact(const impact::v1::Components& components, const impact::v1::Dependencies& dependencies,
                                const NodeSet* visible_ids = nullptr);

// Single-source BFS: every node reachable from start with its hop depth, in
// discovery order. start itself is not included.
std::vector<std::pair<NodeId, std::uint32_t>> ReachableWithDepth(const NodeId& start, const Adjacency& adjacency);

} // namespace impact::graph
