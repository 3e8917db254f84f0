#include "rs/recipe/RoundScrollbarRecipe.hpp"
#include "rs/pipelines/PipelineCatalog.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace rs {

namespace {

struct Vec2 {
  float x, y;
};

Vec2 normalized(Vec2 v) {
  float len = std::sqrt(v.x * v.x + v.y * v.y);
  if (len <= 0.0f) return {0.0f, 0.0f};
  return {v.x / len, v.y / len};
}

class ClipWriter {
public:
  ClipWriter(std::vector<float>& out, int viewW, int viewH)
    : out_(out), sx_(2.0f / static_cast<float>(viewW)), sy_(2.0f / static_cast<float>(viewH)) {}

  void tri(Vec2 a, Vec2 b, Vec2 c) {
    put(a);
    put(b);
    put(c);
  }

private:
  // Pixels have y down; clip space has y up.
  void put(Vec2 p) {
    out_.push_back(p.x * sx_ - 1.0f);
    out_.push_back(1.0f - p.y * sy_);
  }

  std::vector<float>& out_;
  float sx_, sy_;
};

} // namespace

RoundScrollbarRecipe::RoundScrollbarRecipe(Id idBase, const RoundScrollbarRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult RoundScrollbarRecipe::build() const {
  RecipeBuildResult result;
  auto idStr = [](Id id) { return std::to_string(id); };

  struct Part {
    Id buffer, geometry, drawItem;
    const char* suffix;
  };
  const Part parts[2] = {
    {trackBufferId(), trackGeometryId(), trackDrawItemId(), "_track"},
    {thumbBufferId(), thumbGeometryId(), thumbDrawItemId(), "_thumb"},
  };

  for (const Part& p : parts) {
    result.createCommands.push_back(
      R"({"cmd":"createBuffer","id":)" + idStr(p.buffer) + R"(,"byteLength":0})");
    result.createCommands.push_back(
      R"({"cmd":"createGeometry","id":)" + idStr(p.geometry) +
      R"(,"vertexBufferId":)" + idStr(p.buffer) +
      R"(,"format":"pos2_clip","vertexCount":0})");
    result.createCommands.push_back(
      R"({"cmd":"createDrawItem","id":)" + idStr(p.drawItem) +
      R"(,"layerId":)" + idStr(config_.layerId) +
      R"(,"name":")" + config_.name + p.suffix + R"("})");
    result.createCommands.push_back(
      R"({"cmd":"bindDrawItem","drawItemId":)" + idStr(p.drawItem) +
      R"(,"pipeline":")" + kArcPipeline + R"(","geometryId":)" + idStr(p.geometry) + "}");
    // Invisible until the first paint.
    result.createCommands.push_back(
      R"({"cmd":"setDrawItemColor","drawItemId":)" + idStr(p.drawItem) +
      R"(,"r":0,"g":0,"b":0,"a":0})");
  }

  // Dispose in reverse creation order.
  for (int i = 1; i >= 0; --i) {
    result.disposeCommands.push_back(R"({"cmd":"delete","id":)" + idStr(parts[i].drawItem) + "}");
    result.disposeCommands.push_back(R"({"cmd":"delete","id":)" + idStr(parts[i].geometry) + "}");
    result.disposeCommands.push_back(R"({"cmd":"delete","id":)" + idStr(parts[i].buffer) + "}");
  }

  return result;
}

RoundScrollbarRecipe::ArcData RoundScrollbarRecipe::computeArcs(
    const ScrollbarFrame& frame, int viewW, int viewH) const {
  ArcData data{};

  ArcRect rect = arcRectForView(static_cast<float>(viewW), static_cast<float>(viewH),
                                frame.padding, frame.strokeWidth);

  data.trackVerts = tessellateArc(rect, frame.track.startAngle, frame.track.length,
                                  frame.strokeWidth, viewW, viewH);
  data.thumbVerts = tessellateArc(rect, frame.thumb.startAngle, frame.thumb.length,
                                  frame.strokeWidth, viewW, viewH);

  for (int i = 0; i < 3; ++i) {
    data.trackColor[i] = frame.trackColor[i];
    data.thumbColor[i] = frame.thumbColor[i];
  }
  data.trackColor[3] = std::clamp(paintedAlpha(frame.track, frame.opacity), 0.0f, 1.0f);
  data.thumbColor[3] = std::clamp(paintedAlpha(frame.thumb, frame.opacity), 0.0f, 1.0f);
  return data;
}

std::vector<float> RoundScrollbarRecipe::tessellateArc(const ArcRect& rect, float startAngle,
                                                       float sweep, float strokeWidth,
                                                       int viewW, int viewH) const {
  std::vector<float> out;
  if (viewW <= 0 || viewH <= 0) return out;
  if (!(std::fabs(sweep) > 0.0f) || !(strokeWidth > 0.0f)) return out;
  if (!(rect.width > 0.0f) || !(rect.height > 0.0f)) return out;

  const float rx = rect.width * 0.5f;
  const float ry = rect.height * 0.5f;
  const float hw = strokeWidth * 0.5f;
  const float dir = sweep > 0.0f ? 1.0f : -1.0f;

  auto centerAt = [&](float a) {
    return Vec2{rect.cx + rx * std::cos(a), rect.cy + ry * std::sin(a)};
  };
  // Outward normal of the ellipse at parameter a.
  auto normalAt = [&](float a) {
    return normalized(Vec2{ry * std::cos(a), rx * std::sin(a)});
  };
  // Direction of travel along the stroke.
  auto tangentAt = [&](float a) {
    Vec2 t = normalized(Vec2{-rx * std::sin(a), ry * std::cos(a)});
    return Vec2{t.x * dir, t.y * dir};
  };

  const float maxSeg = config_.maxSegmentAngle > 0.0f ? config_.maxSegmentAngle : 0.035f;
  const int segments = std::max(1, static_cast<int>(std::ceil(std::fabs(sweep) / maxSeg)));
  const int capSegs = std::max(1, config_.capSegments);
  out.reserve(static_cast<std::size_t>(segments * 12 + capSegs * 12));

  ClipWriter w(out, viewW, viewH);

  // Body: one quad (two triangles) per segment.
  float a0 = startAngle;
  Vec2 c0 = centerAt(a0);
  Vec2 n0 = normalAt(a0);
  for (int i = 1; i <= segments; ++i) {
    float a1 = startAngle + sweep * static_cast<float>(i) / static_cast<float>(segments);
    Vec2 c1 = centerAt(a1);
    Vec2 n1 = normalAt(a1);

    Vec2 o0{c0.x + n0.x * hw, c0.y + n0.y * hw};
    Vec2 i0{c0.x - n0.x * hw, c0.y - n0.y * hw};
    Vec2 o1{c1.x + n1.x * hw, c1.y + n1.y * hw};
    Vec2 i1{c1.x - n1.x * hw, c1.y - n1.y * hw};
    w.tri(o0, i0, o1);
    w.tri(i0, i1, o1);

    c0 = c1;
    n0 = n1;
  }

  // Round caps: half discs pointing away from the stroke at each end.
  auto cap = [&](float a, float away) {
    Vec2 c = centerAt(a);
    Vec2 n = normalAt(a);
    Vec2 t = tangentAt(a);
    Vec2 d{t.x * away, t.y * away};
    Vec2 prev{c.x + n.x * hw, c.y + n.y * hw};
    for (int k = 1; k <= capSegs; ++k) {
      float th = kPi * static_cast<float>(k) / static_cast<float>(capSegs);
      float cs = std::cos(th);
      float sn = std::sin(th);
      Vec2 next{c.x + (n.x * cs + d.x * sn) * hw, c.y + (n.y * cs + d.y * sn) * hw};
      w.tri(c, prev, next);
      prev = next;
    }
  };
  cap(startAngle, -1.0f);
  cap(startAngle + sweep, 1.0f);

  return out;
}

} // namespace rs
