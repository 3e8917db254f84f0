#pragma once
#include "rs/scene/Geometry.hpp"
#include <cstdint>
#include <string>

namespace rs {

// Arc strokes are tessellated on the CPU, so one solid-triangle pipeline
// covers every draw item.
inline constexpr const char* kArcPipeline = "triSolid@1";

struct PipelineSpec {
  const char* key;
  VertexFormat vertexFormat;
  std::uint32_t verticesPerPrimitive;
};

// nullptr for keys no renderer can draw.
const PipelineSpec* findPipeline(const std::string& key);

} // namespace rs
