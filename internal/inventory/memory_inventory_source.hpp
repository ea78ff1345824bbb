#pragma once

#include <mutex>
#include <string>

#include "internal/inventory/inventory_source.hpp"
#include "internal/inventory/result.hpp"

namespace impact::inventory {

/*
  In-process inventory.

  Writes are keyed by id (upsert replaces). Dependencies must reference
  existing components, and removing a component removes its edges and
  clears workflow step references to it.
*/
class MemoryInventorySource final : public InventorySource {
 public:
  MemoryInventorySource() = default;
  explicit MemoryInventorySource(impact::v1::InventorySnapshot initial);

  impact::v1::InventorySnapshot Load() override;

  Result UpsertComponent(const impact::v1::Component& component);
  Result UpsertDependency(const impact::v1::Dependency& dependency);
  Result UpsertWorkflow(const impact::v1::BusinessWorkflow& workflow);

  Result SetStatus(const std::string& component_id, impact::v1::ComponentStatus status);

  Result RemoveComponent(const std::string& id);
  Result RemoveDependency(const std::string& id);
  Result RemoveWorkflow(const std::string& id);

 private:
  std::mutex                    mutex_;
  impact::v1::InventorySnapshot state_;
};

} // namespace impact::inventory
