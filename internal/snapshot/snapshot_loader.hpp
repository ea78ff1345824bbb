#pragma once

#include <string>

#include "impact/v1.hpp"

namespace impact::snapshot {

/*
  Reads an inventory snapshot document.

  The document is the protobuf JSON mapping of InventorySnapshot, written
  either as JSON or as YAML. Unknown fields are rejected.
*/
class SnapshotLoader {
 public:
  // Throws util::NotFound when the file does not exist, util::InvalidSnapshot
  // when it cannot be parsed.
  static impact::v1::InventorySnapshot LoadFromFile(const std::string& path);

  static impact::v1::InventorySnapshot LoadFromString(const std::string& document);
};

} // namespace impact::snapshot
