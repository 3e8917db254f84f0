#pragma once
#include "rs/debug/Stats.hpp"
#include "rs/gl/GpuBufferManager.hpp"
#include "rs/scene/Scene.hpp"
#include <glad/gl.h>

namespace rs {

// Draws arc draw items (kArcPipeline) with straight-alpha blending, in
// ascending pane/layer/drawItem id order.
class Renderer {
public:
  Renderer() = default;
  ~Renderer();

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  // Builds the solid-colour program and VAO. Needs a current GL context.
  bool init();

  void setClearColor(const float rgba[4]);

  Stats render(const Scene& scene, GpuBufferManager& gpuBufs, int viewW, int viewH);

private:
  bool drawArc(const DrawItem& di, const Scene& scene, const GpuBufferManager& gpuBufs);

  GLuint program_{0};
  GLuint aPos_{0};
  GLint uColor_{-1};
  GLuint vao_{0};
  float clearColor_[4] = {0.0f, 0.0f, 0.0f, 1.0f};
};

} // namespace rs
