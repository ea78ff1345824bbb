#include "internal/inventory/file_inventory_source.hpp"

#include <utility>

#include "internal/snapshot/snapshot_loader.hpp"

namespace impact::inventory {

FileInventorySource::FileInventorySource(std::string path) : path_(std::move(path)) {
}

impact::v1::InventorySnapshot FileInventorySource::Load() {
  return snapshot::SnapshotLoader::LoadFromFile(path_);
}

} // namespace impact::inventory
