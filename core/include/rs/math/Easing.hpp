#pragma once
#include <cstdint>
#include <string>

namespace rs {

enum class Curve : std::uint8_t {
  Linear = 0,
  EaseIn,
  EaseOut,
  EaseInOut,
  EaseInOutCirc,
  FastOutSlowIn
};

// Cubic bezier from (0,0) to (1,1) with control points (a,b) and (c,d).
struct CubicCurve {
  float a, b, c, d;

  float transform(float t) const;
};

// Maps t in [0,1] to eased progress. Input is clamped; f(0)=0, f(1)=1.
float applyCurve(Curve curve, float t);

const char* curveName(Curve curve);

// Accepts the names produced by curveName(). Returns false on unknown names.
bool curveFromName(const std::string& name, Curve& out);

} // namespace rs
