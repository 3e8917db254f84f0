#include "rs/scene/ResourceRegistry.hpp"

namespace rs {

Id ResourceRegistry::allocate(ResourceKind kind) {
  while (!reserve(nextAuto_, kind)) ++nextAuto_;
  return nextAuto_++;
}

bool ResourceRegistry::reserve(Id id, ResourceKind kind) {
  return id != kInvalidId && kinds_.emplace(id, kind).second;
}

bool ResourceRegistry::release(Id id) {
  return kinds_.erase(id) != 0;
}

std::optional<ResourceKind> ResourceRegistry::kindOf(Id id) const {
  auto it = kinds_.find(id);
  if (it == kinds_.end()) return std::nullopt;
  return it->second;
}

std::vector<Id> ResourceRegistry::list(ResourceKind kind) const {
  std::vector<Id> ids;
  for (const auto& [id, k] : kinds_) {
    if (k == kind) ids.push_back(id);
  }
  return ids;
}

} // namespace rs
