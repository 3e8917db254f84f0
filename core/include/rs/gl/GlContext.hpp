#pragma once
#include <cstdint>
#include <vector>

namespace rs {

// Owns a current GL 3.3 core context with loaded function pointers.
class GlContext {
public:
  virtual ~GlContext() = default;

  // Returns false (and logs) when no context could be made current.
  virtual bool init(int width, int height) = 0;
  virtual void swapBuffers() = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // RGBA, bottom-up rows (GL convention).
  virtual std::vector<std::uint8_t> readPixels() const = 0;
};

} // namespace rs
