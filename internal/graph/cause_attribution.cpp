#include "internal/graph/cause_attribution.hpp"

#include <queue>
#include <utility>

#include "internal/graph/propagation.hpp"

namespace impact::graph {

CauseMap AttributeCauses(const impact::v1::Components& components, const impact::v1::Dependencies& dependencies) {
  return AttributeCauses(OfflineRoots(components), BuildForwardAdjacency(dependencies));
}

CauseMap AttributeCauses(const std::vector<NodeId>& roots, const Adjacency& adjacency) {
  CauseMap causes;

  const NodeSet root_set(roots.begin(), roots.end());
  NodeSet       visited_global;

  for (const auto& root : roots) {
    NodeSet                                      visited{root};
    std::queue<std::pair<NodeId, std::uint32_t>> q;
    q.emplace(root, 0);

    while (!q.empty()) {
      auto [node, depth] = q.front();
      q.pop();

      for (const auto& next : Successors(adjacency, node)) {
        if (!visited.insert(next).second) {
          continue;
        }

        if (!root_set.contains(next)) {
          auto it = causes.find(next);
          if (it == causes.end() || depth + 1 < it->second.hop_distance) {
            causes[next] = ImpactCause{root, node, depth + 1};
          }
        }

        if (!visited_global.contains(next)) {
          q.emplace(next, depth + 1);
        }
      }
    }

    visited_global.insert(roots.begin(), roots.end());
  }

  return causes;
}

} // namespace impact::graph
