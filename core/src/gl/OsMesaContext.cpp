#include "rs/gl/OsMesaContext.hpp"
#include <cstdio>

namespace rs {

OsMesaContext::~OsMesaContext() {
  destroy();
}

void OsMesaContext::destroy() {
  if (ctx_) OSMesaDestroyContext(ctx_);
  ctx_ = nullptr;
}

bool OsMesaContext::init(int width, int height) {
  if (width <= 0 || height <= 0) {
    std::fprintf(stderr, "OsMesaContext: bad size %dx%d\n", width, height);
    return false;
  }
  destroy();

  const int attribs[] = {
    OSMESA_FORMAT, OSMESA_RGBA,
    OSMESA_DEPTH_BITS, 0,
    OSMESA_STENCIL_BITS, 0,
    OSMESA_PROFILE, OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, 3,
    OSMESA_CONTEXT_MINOR_VERSION, 3,
    0,
  };
  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) {
    std::fprintf(stderr, "OsMesaContext: no GL 3.3 core context\n");
    return false;
  }

  pixels_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u, 0);
  const char* failed = nullptr;
  if (!OSMesaMakeCurrent(ctx_, pixels_.data(), GL_UNSIGNED_BYTE, width, height)) {
    failed = "OSMesaMakeCurrent";
  } else if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(OSMesaGetProcAddress))) {
    failed = "gladLoadGL";
  }
  if (failed) {
    std::fprintf(stderr, "OsMesaContext: %s failed\n", failed);
    destroy();
    return false;
  }

  width_ = width;
  height_ = height;
  return true;
}

void OsMesaContext::swapBuffers() {
  // Rendering lands directly in pixels_.
  glFinish();
}

} // namespace rs
