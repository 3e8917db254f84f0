#include "rs/render/SceneArcPainter.hpp"
#include <algorithm>
#include <cstdio>
#include <string>

namespace rs {

SceneArcPainter::SceneArcPainter(CommandProcessor& cp, const RoundScrollbarRecipe& recipe,
                                 int viewW, int viewH)
  : cp_(cp), recipe_(recipe), viewW_(viewW), viewH_(viewH) {}

void SceneArcPainter::setViewSize(int viewW, int viewH) {
  viewW_ = viewW;
  viewH_ = viewH;
}

const std::vector<float>& SceneArcPainter::vertexData(Id bufferId) const {
  static const std::vector<float> kEmpty;
  auto it = vertices_.find(bufferId);
  return it == vertices_.end() ? kEmpty : it->second;
}

std::vector<Id> SceneArcPainter::takeDirtyBuffers() {
  std::vector<Id> out;
  out.swap(dirty_);
  return out;
}

void SceneArcPainter::apply(const std::string& cmd) {
  CmdResult r = cp_.applyJsonText(cmd);
  if (!r.ok) {
    ++failedCommands_;
    std::fprintf(stderr, "SceneArcPainter: %s: %s\n", r.err.code.c_str(), r.err.message.c_str());
  }
}

void SceneArcPainter::writeArc(Id bufferId, Id geometryId, Id drawItemId,
                               std::vector<float> verts, const float color[4]) {
  std::size_t floatCount = verts.size();
  vertices_[bufferId] = std::move(verts);
  if (std::find(dirty_.begin(), dirty_.end(), bufferId) == dirty_.end()) {
    dirty_.push_back(bufferId);
  }

  char buf[256];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setBufferByteLength","bufferId":%llu,"byteLength":%zu})",
    static_cast<unsigned long long>(bufferId), floatCount * sizeof(float));
  apply(buf);

  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setGeometryVertexCount","geometryId":%llu,"vertexCount":%zu})",
    static_cast<unsigned long long>(geometryId), floatCount / 2);
  apply(buf);

  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setDrawItemColor","drawItemId":%llu,"r":%.9g,"g":%.9g,"b":%.9g,"a":%.9g})",
    static_cast<unsigned long long>(drawItemId),
    static_cast<double>(color[0]), static_cast<double>(color[1]),
    static_cast<double>(color[2]), static_cast<double>(color[3]));
  apply(buf);
}

void SceneArcPainter::paint(const ScrollbarFrame& frame) {
  RoundScrollbarRecipe::ArcData data = recipe_.computeArcs(frame, viewW_, viewH_);

  writeArc(recipe_.trackBufferId(), recipe_.trackGeometryId(), recipe_.trackDrawItemId(),
           std::move(data.trackVerts), data.trackColor);
  writeArc(recipe_.thumbBufferId(), recipe_.thumbGeometryId(), recipe_.thumbDrawItemId(),
           std::move(data.thumbVerts), data.thumbColor);
  ++paintCount_;
}

} // namespace rs
