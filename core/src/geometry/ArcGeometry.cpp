#include "rs/geometry/ArcGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace rs {

ArcSegment ArcGeometryMapper::mapTrack() {
  ArcSegment s;
  s.startAngle = kTrackStartAngle;
  s.length = kTrackLength;
  return s;
}

ArcSegment ArcGeometryMapper::mapThumb(float fractionVisible, float scrollIndex) {
  ArcSegment s;
  s.startAngle = kTrackStartAngle;
  if (!(fractionVisible > 0.0f) || !std::isfinite(fractionVisible)) {
    return s;
  }
  float fv = std::min(fractionVisible, 1.0f);

  // Keep the thumb inside the track: index ranges over [0, 1/fv - 1].
  float maxIndex = 1.0f / fv - 1.0f;
  float idx = std::isfinite(scrollIndex) ? scrollIndex : 0.0f;
  idx = std::clamp(idx, 0.0f, std::max(0.0f, maxIndex));

  s.length = kTrackLength * fv;
  s.startAngle = s.length * idx + kTrackStartAngle;
  return s;
}

ArcSegment ArcGeometryMapper::mapThumb(const ScrollPosition& pos) {
  if (!(pos.viewportExtent > 0.0)) {
    return mapThumb(0.0f, 0.0f);
  }
  return mapThumb(fractionVisible(pos.viewportExtent, pos.maxExtent),
                  scrollIndex(pos.offset, pos.viewportExtent));
}

float ArcGeometryMapper::fractionVisible(double viewportExtent, double maxExtent) {
  if (!(viewportExtent > 0.0)) return 0.0f;
  double maxE = std::isfinite(maxExtent) ? std::max(0.0, maxExtent) : 0.0;
  return static_cast<float>(1.0 / (maxE / viewportExtent + 1.0));
}

float ArcGeometryMapper::scrollIndex(double offset, double viewportExtent) {
  if (!(viewportExtent > 0.0)) return 0.0f;
  return static_cast<float>(offset / viewportExtent);
}

ArcRect arcRectForView(float viewW, float viewH, float padding, float strokeWidth) {
  ArcRect r;
  r.cx = viewW * 0.5f;
  r.cy = viewH * 0.5f;
  r.width = std::max(0.0f, viewW - 2.0f * padding - strokeWidth);
  r.height = std::max(0.0f, viewH - 2.0f * padding - strokeWidth);
  return r;
}

} // namespace rs
