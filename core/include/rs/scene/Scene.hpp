#pragma once
#include "rs/scene/Geometry.hpp"
#include "rs/scene/Types.hpp"
#include <unordered_map>
#include <vector>

namespace rs {

// Retained scene: Pane -> Layer -> DrawItem, plus buffers and geometries.
class Scene {
public:
  bool hasPane(Id id) const;
  bool hasLayer(Id id) const;
  bool hasDrawItem(Id id) const;
  bool hasBuffer(Id id) const;
  bool hasGeometry(Id id) const;

  const Pane*     getPane(Id id) const;
  const Layer*    getLayer(Id id) const;
  const DrawItem* getDrawItem(Id id) const;
  const Buffer*   getBuffer(Id id) const;
  const Geometry* getGeometry(Id id) const;

  DrawItem* getDrawItemMutable(Id id);
  Buffer*   getBufferMutable(Id id);
  Geometry* getGeometryMutable(Id id);

  // Caller ensures ids are unique in the registry.
  void addPane(Pane p);
  void addLayer(Layer l);
  void addDrawItem(DrawItem d);
  void addBuffer(Buffer b);
  void addGeometry(Geometry g);

  // Cascading deletes; return every deleted id (empty if nothing deleted).
  std::vector<Id> deletePane(Id paneId);
  std::vector<Id> deleteLayer(Id layerId);
  std::vector<Id> deleteDrawItem(Id drawItemId);
  std::vector<Id> deleteBuffer(Id bufferId);
  std::vector<Id> deleteGeometry(Id geometryId);

  // Ascending id order; the renderer draws in this order.
  std::vector<Id> paneIds() const;
  std::vector<Id> layerIds() const;
  std::vector<Id> drawItemIds() const;
  std::vector<Id> bufferIds() const;
  std::vector<Id> geometryIds() const;

private:
  std::unordered_map<Id, Pane> panes_;
  std::unordered_map<Id, Layer> layers_;
  std::unordered_map<Id, DrawItem> drawItems_;
  std::unordered_map<Id, Buffer> buffers_;
  std::unordered_map<Id, Geometry> geometries_;
};

} // namespace rs
