#pragma once
#include "rs/gl/GlContext.hpp"
#include <glad/gl.h>    // GLAD must precede osmesa.h (guards GL/gl.h)

// osmesa.h expects GLAPI and APIENTRY from GL/gl.h, which GLAD suppresses.
#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif

#include <GL/osmesa.h>
#include <vector>

namespace rs {

// Headless GL 3.3 core context drawing into a CPU-side RGBA buffer.
// Used by the render test and the demo when no window is available.
class OsMesaContext : public GlContext {
public:
  OsMesaContext() = default;
  ~OsMesaContext() override;

  OsMesaContext(const OsMesaContext&) = delete;
  OsMesaContext& operator=(const OsMesaContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  // The render target itself; call swapBuffers() first.
  std::vector<std::uint8_t> readPixels() const override { return pixels_; }

private:
  void destroy();

  OSMesaContext ctx_{nullptr};
  int width_{0};
  int height_{0};
  std::vector<std::uint8_t> pixels_;
};

} // namespace rs
