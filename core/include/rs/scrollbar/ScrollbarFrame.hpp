#pragma once
#include "rs/geometry/ArcGeometry.hpp"

namespace rs {

// Everything a painter needs for one frame.
struct ScrollbarFrame {
  ArcSegment track;
  ArcSegment thumb;
  float opacity{0.0f};
  float padding{8.0f};
  float strokeWidth{8.0f};
  float trackColor[4] = {0.0f, 0.0f, 0.0f, 0.0f};
  float thumbColor[4] = {0.0f, 0.0f, 0.0f, 0.0f};
};

// True when any painted input differs.
bool shouldRepaint(const ScrollbarFrame& prev, const ScrollbarFrame& next);

inline float paintedAlpha(const ArcSegment& segment, float opacity) {
  return segment.colorAlphaScale * opacity;
}

} // namespace rs
