#include "internal/graph/cause_attribution.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/graph/propagation.hpp"

namespace {

using impact::graph::AttributeCauses;
using impact::graph::CauseMap;
using impact::graph::ComputeDownstreamImpact;
using impact::graph::NodeSet;
using impact::v1::ComponentStatus;
using impact::v1::InventorySnapshot;

void AddComponent(InventorySnapshot* snapshot, const std::string& id, ComponentStatus status) {
  auto* component = snapshot->add_components();
  component->set_id(id);
  component->set_name(id);
  component->set_type(impact::v1::COMPONENT_TYPE_SERVICE);
  component->set_status(status);
  component->set_criticality(impact::v1::CRITICALITY_LOW);
}

void AddOffline(InventorySnapshot* snapshot, const std::string& id) {
  AddComponent(snapshot, id, impact::v1::COMPONENT_STATUS_OFFLINE);
}

void AddOnline(InventorySnapshot* snapshot, const std::string& id) {
  AddComponent(snapshot, id, impact::v1::COMPONENT_STATUS_ONLINE);
}

void AddDependency(InventorySnapshot* snapshot, const std::string& source, const std::string& target) {
  auto* dependency = snapshot->add_dependencies();
  dependency->set_id(source + "->" + target);
  dependency->set_source_id(source);
  dependency->set_target_id(target);
}

CauseMap Causes(const InventorySnapshot& snapshot) {
  return AttributeCauses(snapshot.components(), snapshot.dependencies());
}

void TestNearestRootWinsRegardlessOfOrder() {
  // R1 reaches N in 2 hops, R2 in 3; R2 is processed first.
  InventorySnapshot snapshot;
  AddOffline(&snapshot, "R2");
  AddOffline(&snapshot, "R1");
  for (const auto* id : {"X", "Y", "Z", "N"}) AddOnline(&snapshot, id);
  AddDependency(&snapshot, "R1", "X");
  AddDependency(&snapshot, "X", "N");
  AddDependency(&snapshot, "R2", "Y");
  AddDependency(&snapshot, "Y", "Z");
  AddDependency(&snapshot, "Z", "N");

  const auto causes = Causes(snapshot);
  assert(causes.at("N").root_id == "R1");
  assert(causes.at("N").hop_distance == 2);
  assert(causes.at("N").via_id == "X");
  assert(causes.at("Z").root_id == "R2");
  assert(causes.at("Z").hop_distance == 2);
}

void TestEqualDistanceGoesToFirstProcessedRoot() {
  InventorySnapshot snapshot;
  AddOffline(&snapshot, "R2");
  AddOffline(&snapshot, "R1");
  for (const auto* id : {"A", "B", "N"}) AddOnline(&snapshot, id);
  AddDependency(&snapshot, "R1", "A");
  AddDependency(&snapshot, "A", "N");
  AddDependency(&snapshot, "R2", "B");
  AddDependency(&snapshot, "B", "N");

  auto causes = Causes(snapshot);
  assert(causes.at("N").root_id == "R2");
  assert(causes.at("N").hop_distance == 2);
  assert(causes.at("N").via_id == "B");

  // Swap processing order.
  snapshot.mutable_components()->SwapElements(0, 1);
  causes = Causes(snapshot);
  assert(causes.at("N").root_id == "R1");
  assert(causes.at("N").hop_distance == 2);
  assert(causes.at("N").via_id == "A");
}

void TestRootsAreNeverAttributed() {
  InventorySnapshot snapshot;
  AddOffline(&snapshot, "R1");
  AddOffline(&snapshot, "R2");
  AddOnline(&snapshot, "X");
  AddDependency(&snapshot, "R1", "R2");
  AddDependency(&snapshot, "R2", "X");
  AddDependency(&snapshot, "X", "R1");

  const auto causes = Causes(snapshot);
  assert(causes.size() == 1);
  assert(!causes.contains("R1"));
  assert(!causes.contains("R2"));
  assert(causes.at("X").root_id == "R2");
  assert(causes.at("X").hop_distance == 1);
}

// Scenario B: disjoint subgraphs, no cross-attribution.
void TestDisjointRootsAttributeOwnSubgraph() {
  InventorySnapshot snapshot;
  AddOffline(&snapshot, "R1");
  AddOffline(&snapshot, "R2");
  for (const auto* id : {"A", "B", "C", "D"}) AddOnline(&snapshot, id);
  AddDependency(&snapshot, "R1", "A");
  AddDependency(&snapshot, "A", "B");
  AddDependency(&snapshot, "R2", "C");
  AddDependency(&snapshot, "C", "D");

  const auto causes = Causes(snapshot);
  assert(causes.size() == 4);
  assert(causes.at("A").root_id == "R1" && causes.at("A").hop_distance == 1);
  assert(causes.at("B").root_id == "R1" && causes.at("B").hop_distance == 2);
  assert(causes.at("C").root_id == "R2" && causes.at("C").hop_distance == 1);
  assert(causes.at("D").root_id == "R2" && causes.at("D").hop_distance == 2);

  const auto impacted = ComputeDownstreamImpact(snapshot.components(), snapshot.dependencies());
  assert((impacted == NodeSet{"A", "B", "C", "D"}));
}

void TestEveryImpactedNodeHasCauseWithPositiveDistance() {
  InventorySnapshot snapshot;
  AddOffline(&snapshot, "R");
  for (const auto* id : {"A", "B", "C"}) AddOnline(&snapshot, id);
  AddDependency(&snapshot, "R", "A");
  AddDependency(&snapshot, "A", "B");
  AddDependency(&snapshot, "B", "C");
  AddDependency(&snapshot, "C", "A");
  AddDependency(&snapshot, "B", "B");

  const auto causes   = Causes(snapshot);
  const auto impacted = ComputeDownstreamImpact(snapshot.components(), snapshot.dependencies());
  assert(causes.size() == impacted.size());
  for (const auto& id : impacted) {
    assert(causes.at(id).hop_distance >= 1);
    assert(causes.at(id).root_id == "R");
  }
  assert(causes.at("C").hop_distance == 3);
}

void TestNoOfflineComponentsGivesNoCauses() {
  InventorySnapshot snapshot;
  AddOnline(&snapshot, "A");
  AddOnline(&snapshot, "B");
  AddDependency(&snapshot, "A", "B");

  assert(Causes(snapshot).empty());
}

} // namespace

int main() {
  TestNearestRootWinsRegardlessOfOrder();
  TestEqualDistanceGoesToFirstProcessedRoot();
  TestRootsAreNeverAttributed();
  TestDisjointRootsAttributeOwnSubgraph();
  TestEveryImpactedNodeHasCauseWithPositiveDistance();
  TestNoOfflineComponentsGivesNoCauses();

  std::cout << "impact_unit_cause_attribution: pass\n";
  return 0;
}
