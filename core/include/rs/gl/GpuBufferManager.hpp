#pragma once
#include "rs/ids/Id.hpp"
#include <glad/gl.h>
#include <cstdint>
#include <map>
#include <vector>

namespace rs {

// Mirrors arc vertex data (pos2_clip floats) into one VBO per scene buffer.
// setVertices() stages on the CPU; uploadDirty() pushes staged buffers.
class GpuBufferManager {
public:
  GpuBufferManager() = default;
  ~GpuBufferManager();

  GpuBufferManager(const GpuBufferManager&) = delete;
  GpuBufferManager& operator=(const GpuBufferManager&) = delete;

  void setVertices(Id bufferId, std::vector<float> verts);

  // Returns the number of bytes sent to the GPU.
  std::uint64_t uploadDirty();

  // 0 until the buffer has been uploaded once.
  GLuint vbo(Id bufferId) const;

  std::uint32_t bufferCount() const { return static_cast<std::uint32_t>(slots_.size()); }

private:
  struct Slot {
    std::vector<float> verts;
    GLuint vbo{0};
    bool staged{false};
  };
  std::map<Id, Slot> slots_;
};

} // namespace rs
