#include "internal/graph/component_index.hpp"

namespace impact::graph {

using namespace impact::v1;

ComponentIndex::ComponentIndex(const Components& components) {
  by_id_.reserve(components.size());
  for (const auto& component : components) {
    by_id_.try_emplace(component.id(), &component);
  }
}

const Component* ComponentIndex::Find(const std::string& id) const {
  auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return nullptr;
  }
  return it->second;
}

std::string ComponentIndex::Name(const std::string& id) const {
  const auto* component = Find(id);
  if (!component || component->name().empty()) {
    return "Unknown";
  }
  return component->name();
}

bool ComponentIndex::IsOnline(const std::string& id) const {
  const auto* component = Find(id);
  return component && component->status() == COMPONENT_STATUS_ONLINE;
}

} // namespace impact::graph
