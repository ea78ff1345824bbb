#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "impact/v1.hpp"

namespace impact::graph {

using NodeId    = std::string;
using NodeSet   = std::unordered_set<NodeId>;
using Adjacency = std::unordered_map<NodeId, std::vector<NodeId>>;

/*
  Forward adjacency: source_id -> target_ids, in dependency order.

  When allowed_ids is given, edges with either endpoint outside of it are
  skipped. Parallel edges are kept, so a successor can appear twice.
*/
Adjacency BuildForwardAdjacency(const impact::v1::Dependencies& dependencies, const NodeSet* allowed_ids = nullptr);

// Successors of id, or an empty list when id has no outgoing edges.
const std::vector<NodeId>& Successors(const Adjacency& adjacency, const NodeId& id);

} // namespace impact::graph
