#pragma once

#include "impact/v1.hpp"

namespace impact::inventory {

/*
  Snapshot acquisition.

  The analysis core only ever reads one consistent snapshot per call;
  Load() must return a copy that later mutations of the backing store do
  not affect. Implementations may be called from several threads.
*/
class InventorySource {
 public:
  virtual ~InventorySource() = default;

  virtual impact::v1::InventorySnapshot Load() = 0;
};

} // namespace impact::inventory
