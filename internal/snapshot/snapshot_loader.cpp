#include "internal/snapshot/snapshot_loader.hpp"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>

#include "internal/util/errors.hpp"
#include "internal/util/yaml_json.hpp"

namespace impact::snapshot {

using impact::v1::InventorySnapshot;

namespace {

InventorySnapshot Parse(const YAML::Node& yaml) {
  InventorySnapshot snapshot;
  if (yaml.IsNull()) {
    return snapshot;
  }

  std::string json;
  try {
    json = util::YamlToJson(yaml);
  } catch (const std::exception& e) {
    throw util::InvalidSnapshot(e.what());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &snapshot, options);
  if (!status.ok()) {
    throw util::InvalidSnapshot("Invalid snapshot: " + std::string(status.message()));
  }
  return snapshot;
}

} // namespace

InventorySnapshot SnapshotLoader::LoadFromFile(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("snapshot file not found: " + path);
  }

  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidSnapshot("Failed to read snapshot " + path + ": " + e.what());
  }
  return Parse(yaml);
}

InventorySnapshot SnapshotLoader::LoadFromString(const std::string& document) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(document);
  } catch (const std::exception& e) {
    throw util::InvalidSnapshot("Failed to parse snapshot: " + std::string(e.what()));
  }
  return Parse(yaml);
}

} // namespace impact::snapshot
