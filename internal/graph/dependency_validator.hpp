#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/graph/adjacency.hpp"

namespace impact::graph {

struct DependencyCheck {
  std::vector<std::string> errors;

  bool ok() const {
    return errors.empty();
  }
};

/*
  Structural checks used when a dependency is proposed to the inventory.

  None of these are enforced by the propagation code, which handles
  cycles, duplicates and self-loops on its own.
*/
class DependencyValidator {
 public:
  // Self-loop, duplicate source/target pair, and would-create-cycle.
  static DependencyCheck Validate(const impact::v1::Dependency& candidate, const impact::v1::Dependencies& existing);

  // True if target can already reach source, so source -> target closes a loop.
  static bool WouldCreateCycle(const impact::v1::Dependency& candidate, const impact::v1::Dependencies& existing);

  // Each cycle is listed as its node path, closed by repeating the first node.
  static std::vector<std::vector<NodeId>> DetectCycles(const impact::v1::Dependencies& dependencies);

  // Nodes with at least `threshold` outgoing edges and at most one incoming.
  static std::vector<NodeId> SinglePointsOfFailure(const impact::v1::Dependencies& dependencies, std::size_t threshold = 2);

  // Advisory only: warnings for combinations that rarely make sense.
  static std::vector<std::string> CheckTypeCompatibility(impact::v1::ComponentType source_type, impact::v1::ComponentType target_type,
                                                         impact::v1::DependencyType dependency_type);
};

} // namespace impact::graph
