#include "internal/inventory/memory_inventory_source.hpp"

#include <algorithm>
#include <utility>

namespace impact::inventory {

using namespace impact::v1;

namespace {

template <typename T>
T* FindById(google::protobuf::RepeatedPtrField<T>* items, const std::string& id) {
  for (auto& item : *items) {
    if (item.id() == id) {
      return &item;
    }
  }
  return nullptr;
}

template <typename T, typename Pred>
int EraseIf(google::protobuf::RepeatedPtrField<T>* items, Pred pred) {
  auto it      = std::remove_if(items->begin(), items->end(), pred);
  int  removed = static_cast<int>(items->end() - it);
  items->DeleteSubrange(static_cast<int>(it - items->begin()), removed);
  return removed;
}

void DropComponentReferences(WorkflowStep* step, const std::string& id) {
  if (step->primary_component_id() == id) {
    step->clear_primary_component_id();
  }
  EraseIf(step->mutable_primary_component_ids(), [&](const std::string& ref) { return ref == id; });
  EraseIf(step->mutable_alternative_component_ids(), [&](const std::string& ref) { return ref == id; });
}

} // namespace

MemoryInventorySource::MemoryInventorySource(InventorySnapshot initial) : state_(std::move(initial)) {
}

InventorySnapshot MemoryInventorySource::Load() {
  std::scoped_lock lock(mutex_);
  return state_; // snapshot copy
}

Result MemoryInventorySource::UpsertComponent(const Component& component) {
  if (component.id().empty()) return Result::Err(ErrorCode::ConstraintViolation, "component id is required");

  std::scoped_lock lock(mutex_);
  if (auto* existing = FindById(state_.mutable_components(), component.id())) {
    *existing = component;
  } else {
    *state_.add_components() = component;
  }
  return Result::Ok();
}

Result MemoryInventorySource::UpsertDependency(const Dependency& dependency) {
  if (dependency.id().empty()) return Result::Err(ErrorCode::ConstraintViolation, "dependency id is required");

  std::scoped_lock lock(mutex_);
  if (!FindById(state_.mutable_components(), dependency.source_id())) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown source component: " + dependency.source_id());
  }
  if (!FindById(state_.mutable_components(), dependency.target_id())) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown target component: " + dependency.target_id());
  }

  if (auto* existing = FindById(state_.mutable_dependencies(), dependency.id())) {
    *existing = dependency;
  } else {
    *state_.add_dependencies() = dependency;
  }
  return Result::Ok();
}

Result MemoryInventorySource::UpsertWorkflow(const BusinessWorkflow& workflow) {
  if (workflow.id().empty()) return Result::Err(ErrorCode::ConstraintViolation, "workflow id is required");

  std::scoped_lock lock(mutex_);
  if (auto* existing = FindById(state_.mutable_workflows(), workflow.id())) {
    *existing = workflow;
  } else {
    *state_.add_workflows() = workflow;
  }
  return Result::Ok();
}

Result MemoryInventorySource::SetStatus(const std::string& component_id, ComponentStatus status) {
  std::scoped_lock lock(mutex_);
  auto*            component = FindById(state_.mutable_components(), component_id);
  if (!component) return Result::Err(ErrorCode::NotFound, component_id);

  component->set_status(status);
  return Result::Ok();
}

Result MemoryInventorySource::RemoveComponent(const std::string& id) {
  std::scoped_lock lock(mutex_);
  if (EraseIf(state_.mutable_components(), [&](const Component& c) { return c.id() == id; }) == 0) {
    return Result::Err(ErrorCode::NotFound, id);
  }

  EraseIf(state_.mutable_dependencies(), [&](const Dependency& d) { return d.source_id() == id || d.target_id() == id; });
  for (auto& workflow : *state_.mutable_workflows()) {
    for (auto& step : *workflow.mutable_steps()) {
      DropComponentReferences(&step, id);
    }
  }
  return Result::Ok();
}

Result MemoryInventorySource::RemoveDependency(const std::string& id) {
  std::scoped_lock lock(mutex_);
  if (EraseIf(state_.mutable_dependencies(), [&](const Dependency& d) { return d.id() == id; }) == 0) {
    return Result::Err(ErrorCode::NotFound, id);
  }
  return Result::Ok();
}

Result MemoryInventorySource::RemoveWorkflow(const std::string& id) {
  std::scoped_lock lock(mutex_);
  if (EraseIf(state_.mutable_workflows(), [&](const BusinessWorkflow& w) { return w.id() == id; }) == 0) {
    return Result::Err(ErrorCode::NotFound, id);
  }
  return Result::Ok();
}

} // namespace impact::inventory
