#include "internal/graph/dependency_validator.hpp"

#include <algorithm>
#include <queue>
#include <unordered_map>
#include <utility>

#include "internal/model/labels.hpp"

namespace impact::graph {

using namespace impact::v1;

namespace {

// Node ids in order of first appearance as an endpoint.
std::vector<NodeId> NodesInEdgeOrder(const Dependencies& dependencies) {
  std::vector<NodeId> nodes;
  NodeSet             seen;
  for (const auto& dependency : dependencies) {
    if (seen.insert(dependency.source_id()).second) nodes.push_back(dependency.source_id());
    if (seen.insert(dependency.target_id()).second) nodes.push_back(dependency.target_id());
  }
  return nodes;
}

struct DfsFrame {
  NodeId      node;
  std::size_t next = 0;
};

// Iterative DFS so long dependency chains cannot exhaust the call stack.
void FindCycles(const NodeId& start, const Adjacency& adjacency, NodeSet& visited, NodeSet& on_stack,
                std::vector<std::vector<NodeId>>& cycles) {
  std::vector<DfsFrame> stack;
  std::vector<NodeId>   path;

  auto enter = [&](const NodeId& node) {
    visited.insert(node);
    on_stack.insert(node);
    path.push_back(node);
    stack.push_back({node, 0});
  };

  enter(start);
  while (!stack.empty()) {
    auto&       frame      = stack.back();
    const auto& successors = Successors(adjacency, frame.node);

    if (frame.next == successors.size()) {
      on_stack.erase(frame.node);
      path.pop_back();
      stack.pop_back();
      continue;
    }

    const auto& next = successors[frame.next++];
    if (!visited.contains(next)) {
      enter(next);
    } else if (on_stack.contains(next)) {
      auto cycle_start = std::find(path.begin(), path.end(), next);
      if (cycle_start != path.end()) {
        std::vector<NodeId> cycle(cycle_start, path.end());
        cycle.push_back(next);
        cycles.push_back(std::move(cycle));
      }
    }
  }
}

struct TypeRule {
  ComponentType              source;
  DependencyType             dependency;
  std::vector<ComponentType> allowed_targets;
};

const std::vector<TypeRule>& TypeRules() {
  static const std::vector<TypeRule> kRules = {
      {COMPONENT_TYPE_LOAD_BALANCER, DEPENDENCY_TYPE_FEEDS, {COMPONENT_TYPE_SERVER, COMPONENT_TYPE_APPLICATION}},
      {COMPONENT_TYPE_LOAD_BALANCER, DEPENDENCY_TYPE_REQUIRES, {COMPONENT_TYPE_NETWORK}},
      {COMPONENT_TYPE_LOAD_BALANCER, DEPENDENCY_TYPE_USES, {COMPONENT_TYPE_NETWORK}},
      {COMPONENT_TYPE_API, DEPENDENCY_TYPE_REQUIRES, {COMPONENT_TYPE_DATABASE, COMPONENT_TYPE_SERVICE}},
      {COMPONENT_TYPE_API, DEPENDENCY_TYPE_USES, {COMPONENT_TYPE_DATABASE, COMPONENT_TYPE_SERVICE, COMPONENT_TYPE_NETWORK}},
      {COMPONENT_TYPE_APPLICATION, DEPENDENCY_TYPE_REQUIRES, {COMPONENT_TYPE_API, COMPONENT_TYPE_DATABASE}},
      {COMPONENT_TYPE_APPLICATION, DEPENDENCY_TYPE_USES, {COMPONENT_TYPE_API, COMPONENT_TYPE_SERVICE, COMPONENT_TYPE_NETWORK}},
      {COMPONENT_TYPE_DATABASE, DEPENDENCY_TYPE_REQUIRES, {COMPONENT_TYPE_SERVER, COMPONENT_TYPE_NETWORK}},
      {COMPONENT_TYPE_DATABASE, DEPENDENCY_TYPE_MONITORS, {COMPONENT_TYPE_SERVER}},
  };
  return kRules;
}

} // namespace

DependencyCheck DependencyValidator::Validate(const Dependency& candidate, const Dependencies& existing) {
  DependencyCheck check;

  if (candidate.source_id() == candidate.target_id()) {
    check.errors.push_back("a component cannot depend on itself");
  }

  const bool duplicate = std::any_of(existing.begin(), existing.end(), [&](const Dependency& dependency) {
    return dependency.source_id() == candidate.source_id() && dependency.target_id() == candidate.target_id() && dependency.id() != candidate.id();
  });
  if (duplicate) {
    check.errors.push_back("dependency already exists");
  }

  if (candidate.source_id() != candidate.target_id() && WouldCreateCycle(candidate, existing)) {
    check.errors.push_back("dependency would create a circular dependency");
  }

  return check;
}

bool DependencyValidator::WouldCreateCycle(const Dependency& candidate, const Dependencies& existing) {
  const auto adjacency = BuildForwardAdjacency(existing);

  std::queue<NodeId> q;
  NodeSet            visited{candidate.target_id()};
  q.push(candidate.target_id());

  while (!q.empty()) {
    const auto node = q.front();
    q.pop();

    if (node == candidate.source_id()) {
      return true;
    }

    for (const auto& next : Successors(adjacency, node)) {
      if (visited.insert(next).second) {
        q.push(next);
      }
    }
  }

  return false;
}

std::vector<std::vector<NodeId>> DependencyValidator::DetectCycles(const Dependencies& dependencies) {
  std::vector<std::vector<NodeId>> cycles;

  const auto adjacency = BuildForwardAdjacency(dependencies);

  NodeSet visited;
  NodeSet on_stack;

  for (const auto& node : NodesInEdgeOrder(dependencies)) {
    if (!visited.contains(node)) {
      FindCycles(node, adjacency, visited, on_stack, cycles);
    }
  }

  return cycles;
}

std::vector<NodeId> DependencyValidator::SinglePointsOfFailure(const Dependencies& dependencies, std::size_t threshold) {
  struct Degree {
    std::size_t incoming = 0;
    std::size_t outgoing = 0;
  };

  std::unordered_map<NodeId, Degree> degrees;
  for (const auto& dependency : dependencies) {
    degrees[dependency.source_id()].outgoing++;
    degrees[dependency.target_id()].incoming++;
  }

  std::vector<NodeId> spofs;
  for (const auto& node : NodesInEdgeOrder(dependencies)) {
    const auto& degree = degrees[node];
    if (degree.outgoing >= threshold && degree.incoming <= 1) {
      spofs.push_back(node);
    }
  }
  return spofs;
}

std::vector<std::string> DependencyValidator::CheckTypeCompatibility(ComponentType source_type, ComponentType target_type,
                                                                     DependencyType dependency_type) {
  std::vector<std::string> warnings;

  for (const auto& rule : TypeRules()) {
    if (rule.source != source_type || rule.dependency != dependency_type) {
      continue;
    }
    if (std::find(rule.allowed_targets.begin(), rule.allowed_targets.end(), target_type) == rule.allowed_targets.end()) {
      warnings.push_back(std::string(model::ToString(source_type)) + " typically doesn't " + std::string(model::ToString(dependency_type)) + " " +
                         std::string(model::ToString(target_type)));
    }
  }

  return warnings;
}

} // namespace impact::graph
