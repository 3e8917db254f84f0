#pragma once
#include "rs/scene/Types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace rs {

// Id ownership for one scene. Commands either name their id (recipes do,
// so ids stay deterministic) or take the next free one.
class ResourceRegistry {
public:
  Id allocate(ResourceKind kind);
  // False when the id is 0 or already owned.
  bool reserve(Id id, ResourceKind kind);
  bool release(Id id);

  std::optional<ResourceKind> kindOf(Id id) const;
  bool exists(Id id) const { return kinds_.count(id) != 0; }

  std::vector<Id> list(ResourceKind kind) const;
  std::size_t size() const { return kinds_.size(); }

private:
  std::map<Id, ResourceKind> kinds_;
  Id nextAuto_{1};
};

} // namespace rs
