#pragma once

#include <string>
#include <unordered_map>

#include "impact/v1.hpp"

namespace impact::graph {

/*
  Id lookup over a component snapshot.

  Holds pointers into the snapshot, which must outlive the index. Ids
  that are not in the snapshot (dangling dependency endpoints) resolve to
  nullptr / "Unknown" instead of failing.
*/
class ComponentIndex {
 public:
  explicit ComponentIndex(const impact::v1::Components& components);

  const impact::v1::Component* Find(const std::string& id) const;

  std::string Name(const std::string& id) const;

  bool IsOnline(const std::string& id) const;

  std::size_t size() const {
    return by_id_.size();
  }

 private:
  std::unordered_map<std::string, const impact::v1::Component*> by_id_;
};

} // namespace impact::graph
