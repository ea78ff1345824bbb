#include "internal/graph/adjacency.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using impact::graph::BuildForwardAdjacency;
using impact::graph::NodeSet;
using impact::graph::Successors;
using impact::v1::Dependencies;

void AddDependency(Dependencies* dependencies, const std::string& source, const std::string& target) {
  auto* dependency = dependencies->Add();
  dependency->set_id(source + "->" + target);
  dependency->set_source_id(source);
  dependency->set_target_id(target);
}

void TestSuccessorsKeepDependencyOrder() {
  Dependencies dependencies;
  AddDependency(&dependencies, "A", "C");
  AddDependency(&dependencies, "A", "B");
  AddDependency(&dependencies, "B", "C");

  const auto adjacency = BuildForwardAdjacency(dependencies);
  assert(adjacency.size() == 2);
  assert((Successors(adjacency, "A") == std::vector<std::string>{"C", "B"}));
  assert((Successors(adjacency, "B") == std::vector<std::string>{"C"}));
  assert(Successors(adjacency, "C").empty());
}

void TestParallelEdgesAreNotDeduplicated() {
  Dependencies dependencies;
  AddDependency(&dependencies, "A", "B");
  AddDependency(&dependencies, "A", "B");

  const auto adjacency = BuildForwardAdjacency(dependencies);
  assert((Successors(adjacency, "A") == std::vector<std::string>{"B", "B"}));
}

void TestAllowSetSkipsEdgesWithEitherEndpointOutside() {
  Dependencies dependencies;
  AddDependency(&dependencies, "A", "B");
  AddDependency(&dependencies, "A", "hidden");
  AddDependency(&dependencies, "hidden", "B");

  const NodeSet allowed{"A", "B"};
  const auto    adjacency = BuildForwardAdjacency(dependencies, &allowed);

  assert(adjacency.size() == 1);
  assert((Successors(adjacency, "A") == std::vector<std::string>{"B"}));
  assert(Successors(adjacency, "hidden").empty());
}

void TestDanglingTargetIsKeptWithoutAllowSet() {
  Dependencies dependencies;
  AddDependency(&dependencies, "A", "ghost");

  const auto adjacency = BuildForwardAdjacency(dependencies);
  assert((Successors(adjacency, "A") == std::vector<std::string>{"ghost"}));
}

} // namespace

int main() {
  TestSuccessorsKeepDependencyOrder();
  TestParallelEdgesAreNotDeduplicated();
  TestAllowSetSkipsEdgesWithEitherEndpointOutside();
  TestDanglingTargetIsKeptWithoutAllowSet();

  std::cout << "impact_unit_adjacency: pass\n";
  return 0;
}
