#pragma once

#include <string>

#include "internal/inventory/inventory_source.hpp"

namespace impact::inventory {

// Re-reads the snapshot document on every Load().
class FileInventorySource final : public InventorySource {
 public:
  explicit FileInventorySource(std::string path);

  impact::v1::InventorySnapshot Load() override;

 private:
  std::string path_;
};

} // namespace impact::inventory
