#pragma once

namespace rs {

inline constexpr float kPi = 3.14159265358979323846f;

// Angles are radians, 0 at 3 o'clock, increasing clockwise in screen space.
// The track starts at the 2 o'clock marker and spans 60 degrees.
inline constexpr float kTrackStartAngle = kPi * (-1.0f / 2.0f + 1.0f / 3.0f);
inline constexpr float kTrackLength = kPi / 3.0f;

struct ArcSegment {
  float startAngle{0.0f};
  float length{0.0f};
  float colorAlphaScale{1.0f}; // painted alpha = colorAlphaScale * opacity
};

struct ScrollPosition {
  double offset{0.0};
  double viewportExtent{0.0};
  double maxExtent{0.0};
};

// Ellipse bounds the arcs are stroked on, in pixels.
struct ArcRect {
  float cx{0.0f}, cy{0.0f};
  float width{0.0f}, height{0.0f};
};

class ArcGeometryMapper {
public:
  static ArcSegment mapTrack();

  // fractionVisible in (0,1]; scrollIndex in units of viewports scrolled.
  // A non-positive fractionVisible yields a zero-length thumb at the track start.
  static ArcSegment mapThumb(float fractionVisible, float scrollIndex);

  // Convenience over raw metrics. viewportExtent <= 0 is degenerate.
  static ArcSegment mapThumb(const ScrollPosition& pos);

  // 1 / (maxExtent/viewportExtent + 1); 0 when the viewport has no extent.
  static float fractionVisible(double viewportExtent, double maxExtent);

  // offset / viewportExtent; 0 when the viewport has no extent.
  static float scrollIndex(double offset, double viewportExtent);
};

// Centered rect inset by padding plus half the stroke on each side.
// Dimensions are floored at zero.
ArcRect arcRectForView(float viewW, float viewH, float padding, float strokeWidth);

} // namespace rs
