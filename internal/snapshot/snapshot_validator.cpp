#include "internal/snapshot/snapshot_validator.hpp"

#include <string>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace impact::snapshot {

using namespace impact::v1;

namespace {

[[noreturn]] void Reject(const std::string& where, const std::string& what) {
  throw util::InvalidSnapshot(where + ": " + what);
}

std::string Where(const char* kind, int index, const std::string& id) {
  std::string where = std::string(kind) + "[" + std::to_string(index) + "]";
  if (!id.empty()) {
    where += " (" + id + ")";
  }
  return where;
}

} // namespace

void SnapshotValidator::Validate(const InventorySnapshot& snapshot) {
  std::unordered_set<std::string> component_ids;

  for (int i = 0; i < snapshot.components_size(); ++i) {
    const auto& component = snapshot.components(i);
    const auto  where     = Where("components", i, component.id());

    if (component.id().empty()) Reject(where, "missing id");
    if (!component_ids.insert(component.id()).second) Reject(where, "duplicate component id");
    if (component.type() == COMPONENT_TYPE_UNSPECIFIED) Reject(where, "missing type");
    if (component.status() == COMPONENT_STATUS_UNSPECIFIED) Reject(where, "missing status");
    if (component.criticality() == CRITICALITY_UNSPECIFIED) Reject(where, "missing criticality");
  }

  for (int i = 0; i < snapshot.dependencies_size(); ++i) {
    const auto& dependency = snapshot.dependencies(i);
    const auto  where      = Where("dependencies", i, dependency.id());

    if (dependency.source_id().empty()) Reject(where, "missing source_id");
    if (dependency.target_id().empty()) Reject(where, "missing target_id");
  }

  for (int i = 0; i < snapshot.workflows_size(); ++i) {
    const auto& workflow = snapshot.workflows(i);
    const auto  where    = Where("workflows", i, workflow.id());

    if (workflow.id().empty()) Reject(where, "missing id");
    for (int j = 0; j < workflow.steps_size(); ++j) {
      if (workflow.steps(j).id().empty()) Reject(where + ".steps[" + std::to_string(j) + "]", "missing id");
    }
  }
}

std::vector<const Dependency*> SnapshotValidator::DanglingDependencies(const InventorySnapshot& snapshot) {
  std::unordered_set<std::string> component_ids;
  for (const auto& component : snapshot.components()) {
    component_ids.insert(component.id());
  }

  std::vector<const Dependency*> dangling;
  for (const auto& dependency : snapshot.dependencies()) {
    if (!component_ids.contains(dependency.source_id()) || !component_ids.contains(dependency.target_id())) {
      dangling.push_back(&dependency);
    }
  }
  return dangling;
}

} // namespace impact::snapshot
