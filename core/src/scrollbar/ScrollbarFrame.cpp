#include "rs/scrollbar/ScrollbarFrame.hpp"

namespace rs {

namespace {

bool sameSegment(const ArcSegment& a, const ArcSegment& b) {
  return a.startAngle == b.startAngle && a.length == b.length &&
         a.colorAlphaScale == b.colorAlphaScale;
}

bool sameColor(const float a[4], const float b[4]) {
  for (int i = 0; i < 4; ++i) {
    if (a[i] != b[i]) return false;
  }
  return true;
}

} // namespace

bool shouldRepaint(const ScrollbarFrame& prev, const ScrollbarFrame& next) {
  return !sameSegment(prev.track, next.track) ||
         !sameSegment(prev.thumb, next.thumb) ||
         prev.opacity != next.opacity ||
         prev.padding != next.padding ||
         prev.strokeWidth != next.strokeWidth ||
         !sameColor(prev.trackColor, next.trackColor) ||
         !sameColor(prev.thumbColor, next.thumbColor);
}

} // namespace rs
