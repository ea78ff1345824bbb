#pragma once

#include <cstdint>
#include <unordered_map>

#include "internal/graph/adjacency.hpp"

namespace impact::graph {

struct ImpactCause {
  NodeId        root_id;
  NodeId        via_id; // predecessor on the shortest path
  std::uint32_t hop_distance = 0;
};

using CauseMap = std::unordered_map<NodeId, ImpactCause>;

/*
  Nearest offline root for every impacted node.

  One BFS per offline root, in snapshot order. A node keeps the entry with
  the smallest hop distance; on equal distance the first-processed root
  wins. Once a root has been processed every offline root joins the global
  visited set, so later traversals do not expand through another root.

  Offline roots are causes, never keys of the result.
*/
CauseMap AttributeCauses(const impact::v1::Components& components, const impact::v1::Dependencies& dependencies);

// Same, over a prebuilt adjacency and an explicit ordered root list.
CauseMap AttributeCauses(const std::vector<NodeId>& roots, const Adjacency& adjacency);

} // namespace impact::graph
