// D2.1: easing curves

#include "rs/math/Easing.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool near(float a, float b, float eps) { return std::fabs(a - b) <= eps; }

int main() {
  const rs::Curve all[] = {
    rs::Curve::Linear, rs::Curve::EaseIn, rs::Curve::EaseOut,
    rs::Curve::EaseInOut, rs::Curve::EaseInOutCirc, rs::Curve::FastOutSlowIn
  };

  // ---- Test 1: endpoints and clamping ----
  {
    for (rs::Curve c : all) {
      requireTrue(rs::applyCurve(c, 0.0f) == 0.0f, "f(0) == 0");
      requireTrue(rs::applyCurve(c, 1.0f) == 1.0f, "f(1) == 1");
      requireTrue(rs::applyCurve(c, -0.5f) == 0.0f, "clamped below");
      requireTrue(rs::applyCurve(c, 3.0f) == 1.0f, "clamped above");
      requireTrue(rs::applyCurve(c, NAN) == 0.0f, "NaN maps to 0");
    }
    std::printf("  Test 1 (endpoints): PASS\n");
  }

  // ---- Test 2: monotonic on [0,1] ----
  {
    for (rs::Curve c : all) {
      float prev = 0.0f;
      for (int i = 1; i <= 100; ++i) {
        float v = rs::applyCurve(c, i / 100.0f);
        requireTrue(v >= prev - 0.01f, "non-decreasing");
        requireTrue(v >= -0.001f && v <= 1.001f, "in range");
        prev = v;
      }
    }
    std::printf("  Test 2 (monotonic): PASS\n");
  }

  // ---- Test 3: shapes ----
  {
    requireTrue(rs::applyCurve(rs::Curve::Linear, 0.3f) == 0.3f, "linear identity");
    requireTrue(near(rs::applyCurve(rs::Curve::EaseInOut, 0.5f), 0.5f, 0.01f),
                "easeInOut symmetric midpoint");
    requireTrue(rs::applyCurve(rs::Curve::EaseIn, 0.25f) < 0.25f, "easeIn starts slow");
    requireTrue(rs::applyCurve(rs::Curve::EaseOut, 0.25f) > 0.25f, "easeOut starts fast");
    requireTrue(rs::applyCurve(rs::Curve::EaseInOutCirc, 0.2f) < 0.2f, "circ starts slow");
    requireTrue(rs::applyCurve(rs::Curve::EaseInOutCirc, 0.8f) > 0.8f, "circ ends slow");
    std::printf("  Test 3 (shapes): PASS\n");
  }

  // ---- Test 4: names ----
  {
    for (rs::Curve c : all) {
      rs::Curve back = rs::Curve::Linear;
      requireTrue(rs::curveFromName(rs::curveName(c), back), "known name");
      requireTrue(back == c, "name maps back");
    }
    rs::Curve untouched = rs::Curve::EaseIn;
    requireTrue(!rs::curveFromName("bounce", untouched), "unknown name rejected");
    requireTrue(untouched == rs::Curve::EaseIn, "out untouched");
    std::printf("  Test 4 (names): PASS\n");
  }

  std::printf("D2.1 easing: ALL PASS\n");
  return 0;
}
