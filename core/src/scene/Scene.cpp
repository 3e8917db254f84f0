#include "rs/scene/Scene.hpp"
#include <algorithm>

namespace rs {

namespace {

template <typename Map>
auto findPtr(Map& m, Id id) -> decltype(&m.begin()->second) {
  auto it = m.find(id);
  return it == m.end() ? nullptr : &it->second;
}

template <typename Map>
std::vector<Id> sortedKeys(const Map& m) {
  std::vector<Id> out;
  out.reserve(m.size());
  for (auto& kv : m) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

template <typename Map>
std::vector<Id> eraseOne(Map& m, Id id) {
  if (m.erase(id) == 0) return {};
  return {id};
}

} // namespace

bool Scene::hasPane(Id id) const     { return panes_.count(id) != 0; }
bool Scene::hasLayer(Id id) const    { return layers_.count(id) != 0; }
bool Scene::hasDrawItem(Id id) const { return drawItems_.count(id) != 0; }
bool Scene::hasBuffer(Id id) const   { return buffers_.count(id) != 0; }
bool Scene::hasGeometry(Id id) const { return geometries_.count(id) != 0; }

const Pane*     Scene::getPane(Id id) const     { return findPtr(panes_, id); }
const Layer*    Scene::getLayer(Id id) const    { return findPtr(layers_, id); }
const DrawItem* Scene::getDrawItem(Id id) const { return findPtr(drawItems_, id); }
const Buffer*   Scene::getBuffer(Id id) const   { return findPtr(buffers_, id); }
const Geometry* Scene::getGeometry(Id id) const { return findPtr(geometries_, id); }

DrawItem* Scene::getDrawItemMutable(Id id) { return findPtr(drawItems_, id); }
Buffer*   Scene::getBufferMutable(Id id)   { return findPtr(buffers_, id); }
Geometry* Scene::getGeometryMutable(Id id) { return findPtr(geometries_, id); }

void Scene::addPane(Pane p)         { panes_[p.id] = std::move(p); }
void Scene::addLayer(Layer l)       { layers_[l.id] = std::move(l); }
void Scene::addDrawItem(DrawItem d) { drawItems_[d.id] = std::move(d); }
void Scene::addBuffer(Buffer b)     { buffers_[b.id] = std::move(b); }
void Scene::addGeometry(Geometry g) { geometries_[g.id] = std::move(g); }

std::vector<Id> Scene::deleteDrawItem(Id drawItemId) { return eraseOne(drawItems_, drawItemId); }
std::vector<Id> Scene::deleteBuffer(Id bufferId)     { return eraseOne(buffers_, bufferId); }
std::vector<Id> Scene::deleteGeometry(Id geometryId) { return eraseOne(geometries_, geometryId); }

std::vector<Id> Scene::deleteLayer(Id layerId) {
  if (!hasLayer(layerId)) return {};

  std::vector<Id> deleted{layerId};
  for (Id id : drawItemIds()) {
    if (drawItems_[id].layerId != layerId) continue;
    drawItems_.erase(id);
    deleted.push_back(id);
  }
  layers_.erase(layerId);
  return deleted;
}

std::vector<Id> Scene::deletePane(Id paneId) {
  if (!hasPane(paneId)) return {};

  std::vector<Id> deleted{paneId};
  for (Id lid : layerIds()) {
    if (layers_[lid].paneId != paneId) continue;
    auto layerDeleted = deleteLayer(lid);
    deleted.insert(deleted.end(), layerDeleted.begin(), layerDeleted.end());
  }
  panes_.erase(paneId);
  return deleted;
}

std::vector<Id> Scene::paneIds() const     { return sortedKeys(panes_); }
std::vector<Id> Scene::layerIds() const    { return sortedKeys(layers_); }
std::vector<Id> Scene::drawItemIds() const { return sortedKeys(drawItems_); }
std::vector<Id> Scene::bufferIds() const   { return sortedKeys(buffers_); }
std::vector<Id> Scene::geometryIds() const { return sortedKeys(geometries_); }

} // namespace rs
