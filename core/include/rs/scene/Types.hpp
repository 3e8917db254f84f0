#pragma once
#include "rs/ids/Id.hpp"
#include <string>

namespace rs {

enum class ResourceKind : std::uint8_t {
  Pane,
  Layer,
  DrawItem,
  Buffer,
  Geometry
};

struct Pane {
  Id id{0};
  std::string name;
};

struct Layer {
  Id id{0};
  Id paneId{0};
  std::string name;
};

struct DrawItem {
  Id id{0};
  Id layerId{0};
  std::string name;

  std::string pipeline;  // catalog key, e.g. kArcPipeline
  Id geometryId{0};

  // Straight (non-premultiplied) RGBA
  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
};

} // namespace rs
