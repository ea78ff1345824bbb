#include "internal/graph/propagation.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/workflow/workflow_impact.hpp"

namespace {

using impact::graph::BuildForwardAdjacency;
using impact::graph::ComputeDownstreamImpact;
using impact::graph::NodeSet;
using impact::graph::OfflineRoots;
using impact::graph::ReachableWithDepth;
using impact::graph::TraverseDownstream;
using impact::v1::ComponentStatus;
using impact::v1::InventorySnapshot;

void AddComponent(InventorySnapshot* snapshot, const std::string& id, ComponentStatus status) {
  auto* component = snapshot->add_components();
  component->set_id(id);
  component->set_name(id);
  component->set_type(impact::v1::COMPONENT_TYPE_SERVER);
  component->set_status(status);
  component->set_criticality(impact::v1::CRITICALITY_MEDIUM);
}

void AddDependency(InventorySnapshot* snapshot, const std::string& source, const std::string& target) {
  auto* dependency = snapshot->add_dependencies();
  dependency->set_id(source + "->" + target);
  dependency->set_source_id(source);
  dependency->set_target_id(target);
  dependency->set_type(impact::v1::DEPENDENCY_TYPE_REQUIRES);
}

NodeSet Impacted(const InventorySnapshot& snapshot) {
  return ComputeDownstreamImpact(snapshot.components(), snapshot.dependencies());
}

bool IsSubset(const NodeSet& a, const NodeSet& b) {
  for (const auto& id : a) {
    if (!b.contains(id)) return false;
  }
  return true;
}

// S1 -> S2 -> S3 with S2 offline: the stored edge direction is walked.
void TestScenarioAPropagatesAlongStoredEdgeDirection() {
  InventorySnapshot snapshot;
  AddComponent(&snapshot, "S1", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "S2", impact::v1::COMPONENT_STATUS_OFFLINE);
  AddComponent(&snapshot, "S3", impact::v1::COMPONENT_STATUS_ONLINE);
  AddDependency(&snapshot, "S1", "S2");
  AddDependency(&snapshot, "S2", "S3");

  const auto impacted = Impacted(snapshot);
  assert((impacted == NodeSet{"S3"}));
  assert(!impacted.contains("S1"));
  assert(!impacted.contains("S2"));
}

void TestNoOfflineComponentsGivesEmptySet() {
  InventorySnapshot snapshot;
  AddComponent(&snapshot, "A", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "B", impact::v1::COMPONENT_STATUS_WARNING);
  AddDependency(&snapshot, "A", "B");

  assert(Impacted(snapshot).empty());
  assert(TraverseDownstream({}, BuildForwardAdjacency(snapshot.dependencies())).empty());
}

void TestRootsNeverImpactEachOther() {
  InventorySnapshot snapshot;
  AddComponent(&snapshot, "R1", impact::v1::COMPONENT_STATUS_OFFLINE);
  AddComponent(&snapshot, "R2", impact::v1::COMPONENT_STATUS_OFFLINE);
  AddComponent(&snapshot, "X", impact::v1::COMPONENT_STATUS_ONLINE);
  AddDependency(&snapshot, "R1", "R2");
  AddDependency(&snapshot, "R2", "R1");
  AddDependency(&snapshot, "R2", "X");
  AddDependency(&snapshot, "R1", "R1");

  const auto impacted = Impacted(snapshot);
  assert((impacted == NodeSet{"X"}));
}

void TestCycleThroughRootTerminates() {
  InventorySnapshot snapshot;
  AddComponent(&snapshot, "A", impact::v1::COMPONENT_STATUS_OFFLINE);
  AddComponent(&snapshot, "B", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "C", impact::v1::COMPONENT_STATUS_ONLINE);
  AddDependency(&snapshot, "A", "B");
  AddDependency(&snapshot, "B", "C");
  AddDependency(&snapshot, "C", "A");
  AddDependency(&snapshot, "C", "B");

  assert((Impacted(snapshot) == NodeSet{"B", "C"}));

  // Without a stop set the root is still excluded.
  const auto adjacency = BuildForwardAdjacency(snapshot.dependencies());
  assert((TraverseDownstream({"A"}, adjacency) == NodeSet{"B", "C"}));
}

void TestStopSetMembersAreNeitherReportedNorExpanded() {
  InventorySnapshot snapshot;
  AddDependency(&snapshot, "A", "B");
  AddDependency(&snapshot, "B", "C");
  AddDependency(&snapshot, "A", "D");

  const auto    adjacency = BuildForwardAdjacency(snapshot.dependencies());
  const NodeSet stop{"B"};
  assert((TraverseDownstream({"A"}, adjacency, &stop) == NodeSet{"D"}));
}

// Scenario B: disjoint roots give the union of their subgraphs.
void TestDisjointRootsGiveUnion() {
  InventorySnapshot snapshot;
  AddComponent(&snapshot, "R1", impact::v1::COMPONENT_STATUS_OFFLINE);
  AddComponent(&snapshot, "A", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "B", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "R2", impact::v1::COMPONENT_STATUS_OFFLINE);
  AddComponent(&snapshot, "C", impact::v1::COMPONENT_STATUS_ONLINE);
  AddDependency(&snapshot, "R1", "A");
  AddDependency(&snapshot, "A", "B");
  AddDependency(&snapshot, "R2", "C");

  assert((OfflineRoots(snapshot.components()) == std::vector<std::string>{"R1", "R2"}));
  assert((Impacted(snapshot) == NodeSet{"A", "B", "C"}));
}

void TestVisibleIdsRestrictPropagation() {
  InventorySnapshot snapshot;
  AddComponent(&snapshot, "R", impact::v1::COMPONENT_STATUS_OFFLINE);
  AddComponent(&snapshot, "A", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "B", impact::v1::COMPONENT_STATUS_ONLINE);
  AddDependency(&snapshot, "R", "A");
  AddDependency(&snapshot, "A", "B");

  const NodeSet visible{"R", "A"};
  assert((ComputeDownstreamImpact(snapshot.components(), snapshot.dependencies(), &visible) == NodeSet{"A"}));
}

void TestDanglingTargetIsReported() {
  InventorySnapshot snapshot;
  AddComponent(&snapshot, "R", impact::v1::COMPONENT_STATUS_OFFLINE);
  AddDependency(&snapshot, "R", "ghost");

  assert((Impacted(snapshot) == NodeSet{"ghost"}));
}

void TestAddingEdgeNeverShrinksImpactedSet() {
  InventorySnapshot snapshot;
  AddComponent(&snapshot, "R", impact::v1::COMPONENT_STATUS_OFFLINE);
  AddComponent(&snapshot, "A", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "B", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "C", impact::v1::COMPONENT_STATUS_ONLINE);
  AddDependency(&snapshot, "R", "A");
  AddDependency(&snapshot, "B", "C");

  const auto before = Impacted(snapshot);
  AddDependency(&snapshot, "A", "B");
  const auto after = Impacted(snapshot);

  assert(IsSubset(before, after));
  assert((after == NodeSet{"A", "B", "C"}));
}

void TestMarkingAnotherRootOfflineNeverShrinksImpactedOrOffline() {
  InventorySnapshot snapshot;
  AddComponent(&snapshot, "R", impact::v1::COMPONENT_STATUS_OFFLINE);
  AddComponent(&snapshot, "A", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "B", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "D", impact::v1::COMPONENT_STATUS_ONLINE);
  AddComponent(&snapshot, "E", impact::v1::COMPONENT_STATUS_ONLINE);
  AddDependency(&snapshot, "R", "A");
  AddDependency(&snapshot, "A", "B");
  AddDependency(&snapshot, "D", "E");

  const auto before = impact::workflow::ImpactedOrOffline(Impacted(snapshot), snapshot.components());

  snapshot.mutable_components(1)->set_status(impact::v1::COMPONENT_STATUS_OFFLINE); // A
  snapshot.mutable_components(3)->set_status(impact::v1::COMPONENT_STATUS_OFFLINE); // D
  const auto impacted_after = Impacted(snapshot);
  const auto after          = impact::workflow::ImpactedOrOffline(impacted_after, snapshot.components());

  assert(IsSubset(before, after));
  assert((impacted_after == NodeSet{"B", "E"}));
}

void TestReachableWithDepthRecordsShortestHops() {
  InventorySnapshot snapshot;
  AddDependency(&snapshot, "A", "B");
  AddDependency(&snapshot, "B", "C");
  AddDependency(&snapshot, "A", "C");
  AddDependency(&snapshot, "C", "A");

  const auto reached = ReachableWithDepth("A", BuildForwardAdjacency(snapshot.dependencies()));
  assert(reached.size() == 2);
  assert(reached[0].first == "B" && reached[0].second == 1);
  assert(reached[1].first == "C" && reached[1].second == 1);
}

} // namespace

int main() {
  TestScenarioAPropagatesAlongStoredEdgeDirection();
  TestNoOfflineComponentsGivesEmptySet();
  TestRootsNeverImpactEachOther();
  TestCycleThroughRootTerminates();
  TestStopSetMembersAreNeitherReportedNorExpanded();
  TestDisjointRootsGiveUnion();
  TestVisibleIdsRestrictPropagation();
  TestDanglingTargetIsReported();
  TestAddingEdgeNeverShrinksImpactedSet();
  TestMarkingAnotherRootOfflineNeverShrinksImpactedOrOffline();
  TestReachableWithDepthRecordsShortestHops();

  std::cout << "impact_unit_propagation: pass\n";
  return 0;
}
