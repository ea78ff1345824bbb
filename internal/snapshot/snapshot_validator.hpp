#pragma once

#include <vector>

#include "impact/v1.hpp"

namespace impact::snapshot {

/*
  Boundary checks run before a snapshot enters the analysis core.

  Rejected (util::InvalidSnapshot):
    - component without id, duplicate component id
    - component with unspecified type, status or criticality
    - dependency without source or target id
    - workflow without id, step without id

  Dangling dependency endpoints (ids with no component) are not an error
  here: referential integrity belongs to the storage side, and the core
  names such nodes "Unknown".
*/
class SnapshotValidator {
 public:
  static void Validate(const impact::v1::InventorySnapshot& snapshot);

  // Dependencies whose source or target is not a known component.
  static std::vector<const impact::v1::Dependency*> DanglingDependencies(const impact::v1::InventorySnapshot& snapshot);
};

} // namespace impact::snapshot
