#include "rs/gl/GpuBufferManager.hpp"
#include <utility>

namespace rs {

GpuBufferManager::~GpuBufferManager() {
  for (auto& entry : slots_) {
    if (entry.second.vbo) glDeleteBuffers(1, &entry.second.vbo);
  }
}

void GpuBufferManager::setVertices(Id bufferId, std::vector<float> verts) {
  Slot& slot = slots_[bufferId];
  slot.verts = std::move(verts);
  slot.staged = true;
}

std::uint64_t GpuBufferManager::uploadDirty() {
  std::uint64_t bytes = 0;
  for (auto& entry : slots_) {
    Slot& slot = entry.second;
    if (!slot.staged) continue;
    slot.staged = false;

    const GLsizeiptr size = static_cast<GLsizeiptr>(slot.verts.size() * sizeof(float));
    if (!slot.vbo) glGenBuffers(1, &slot.vbo);
    glBindBuffer(GL_ARRAY_BUFFER, slot.vbo);
    glBufferData(GL_ARRAY_BUFFER, size, size ? slot.verts.data() : nullptr, GL_DYNAMIC_DRAW);
    bytes += static_cast<std::uint64_t>(size);
  }
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  return bytes;
}

GLuint GpuBufferManager::vbo(Id bufferId) const {
  auto it = slots_.find(bufferId);
  return it != slots_.end() ? it->second.vbo : 0;
}

} // namespace rs
