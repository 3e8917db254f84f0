#include "rs/math/Easing.hpp"
#include <cmath>

namespace rs {

namespace {

constexpr CubicCurve kEaseIn{0.42f, 0.0f, 1.0f, 1.0f};
constexpr CubicCurve kEaseOut{0.0f, 0.0f, 0.58f, 1.0f};
constexpr CubicCurve kEaseInOut{0.42f, 0.0f, 0.58f, 1.0f};
constexpr CubicCurve kEaseInOutCirc{0.785f, 0.135f, 0.15f, 0.86f};
constexpr CubicCurve kFastOutSlowIn{0.4f, 0.0f, 0.2f, 1.0f};

constexpr float kCubicErrorBound = 0.001f;
constexpr int kMaxBisectSteps = 64;

float evaluateCubic(float p1, float p2, float m) {
  float inv = 1.0f - m;
  return 3.0f * p1 * inv * inv * m + 3.0f * p2 * inv * m * m + m * m * m;
}

struct NamedCurve {
  Curve curve;
  const char* name;
};

constexpr NamedCurve kCurveNames[] = {
  {Curve::Linear, "linear"},
  {Curve::EaseIn, "easeIn"},
  {Curve::EaseOut, "easeOut"},
  {Curve::EaseInOut, "easeInOut"},
  {Curve::EaseInOutCirc, "easeInOutCirc"},
  {Curve::FastOutSlowIn, "fastOutSlowIn"},
};

} // namespace

float CubicCurve::transform(float t) const {
  if (!(t > 0.0f)) return 0.0f;
  if (t >= 1.0f) return 1.0f;

  // Bisect on x(m) to find the parameter whose x matches t.
  float start = 0.0f;
  float end = 1.0f;
  float mid = 0.5f;
  for (int i = 0; i < kMaxBisectSteps; ++i) {
    mid = (start + end) * 0.5f;
    float estimate = evaluateCubic(a, c, mid);
    if (std::fabs(t - estimate) < kCubicErrorBound) break;
    if (estimate < t) start = mid;
    else end = mid;
  }
  return evaluateCubic(b, d, mid);
}

float applyCurve(Curve curve, float t) {
  if (!(t > 0.0f)) return 0.0f;
  if (t >= 1.0f) return 1.0f;

  switch (curve) {
    case Curve::Linear:        return t;
    case Curve::EaseIn:        return kEaseIn.transform(t);
    case Curve::EaseOut:       return kEaseOut.transform(t);
    case Curve::EaseInOut:     return kEaseInOut.transform(t);
    case Curve::EaseInOutCirc: return kEaseInOutCirc.transform(t);
    case Curve::FastOutSlowIn: return kFastOutSlowIn.transform(t);
  }
  return t;
}

const char* curveName(Curve curve) {
  for (const auto& nc : kCurveNames) {
    if (nc.curve == curve) return nc.name;
  }
  return "linear";
}

bool curveFromName(const std::string& name, Curve& out) {
  for (const auto& nc : kCurveNames) {
    if (name == nc.name) {
      out = nc.curve;
      return true;
    }
  }
  return false;
}

} // namespace rs
