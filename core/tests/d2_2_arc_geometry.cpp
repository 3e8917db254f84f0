// D2.2: track and thumb arc mapping

#include "rs/geometry/ArcGeometry.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool near(float a, float b, float eps = 1e-5f) { return std::fabs(a - b) <= eps; }

int main() {
  using rs::ArcGeometryMapper;

  // ---- Test 1: fixed track ----
  {
    rs::ArcSegment t = ArcGeometryMapper::mapTrack();
    requireTrue(near(t.startAngle, -rs::kPi / 6.0f), "track starts at -pi/6");
    requireTrue(near(t.length, rs::kPi / 3.0f), "track spans pi/3");
    requireTrue(t.colorAlphaScale == 1.0f, "default alpha scale");
    std::printf("  Test 1 (track): PASS\n");
  }

  // ---- Test 2: fraction visible ----
  {
    requireTrue(near(ArcGeometryMapper::fractionVisible(100.0, 400.0), 0.2f), "100/500");
    requireTrue(near(ArcGeometryMapper::fractionVisible(100.0, 0.0), 1.0f), "fits entirely");
    requireTrue(ArcGeometryMapper::fractionVisible(0.0, 400.0) == 0.0f, "no viewport");
    requireTrue(ArcGeometryMapper::fractionVisible(-5.0, 400.0) == 0.0f, "negative viewport");
    requireTrue(near(ArcGeometryMapper::scrollIndex(250.0, 100.0), 2.5f), "index");
    requireTrue(ArcGeometryMapper::scrollIndex(250.0, 0.0) == 0.0f, "index without viewport");
    std::printf("  Test 2 (fraction): PASS\n");
  }

  // ---- Test 3: thumb at top, middle and end ----
  {
    rs::ScrollPosition pos{0.0, 100.0, 400.0};
    rs::ArcSegment top = ArcGeometryMapper::mapThumb(pos);
    requireTrue(near(top.startAngle, rs::kTrackStartAngle), "top starts at track start");
    requireTrue(near(top.length, rs::kTrackLength * 0.2f), "length = fv * track");

    pos.offset = 200.0;
    rs::ArcSegment mid = ArcGeometryMapper::mapThumb(pos);
    requireTrue(near(mid.startAngle, rs::kTrackStartAngle + 2.0f * mid.length), "mid start");

    pos.offset = 400.0;
    rs::ArcSegment end = ArcGeometryMapper::mapThumb(pos);
    rs::ArcSegment track = ArcGeometryMapper::mapTrack();
    requireTrue(near(end.startAngle + end.length, track.startAngle + track.length, 1e-4f),
                "thumb end meets track end at max offset");
    std::printf("  Test 3 (thumb positions): PASS\n");
  }

  // ---- Test 4: overscroll stays inside the track ----
  {
    rs::ArcSegment track = ArcGeometryMapper::mapTrack();
    rs::ArcSegment over = ArcGeometryMapper::mapThumb(rs::ScrollPosition{900.0, 100.0, 400.0});
    requireTrue(over.startAngle + over.length <= track.startAngle + track.length + 1e-4f,
                "past max clamped");
    rs::ArcSegment under = ArcGeometryMapper::mapThumb(rs::ScrollPosition{-80.0, 100.0, 400.0});
    requireTrue(near(under.startAngle, rs::kTrackStartAngle), "negative offset clamped");
    std::printf("  Test 4 (overscroll): PASS\n");
  }

  // ---- Test 5: degenerate inputs ----
  {
    rs::ArcSegment z = ArcGeometryMapper::mapThumb(rs::ScrollPosition{10.0, 0.0, 400.0});
    requireTrue(z.length == 0.0f && near(z.startAngle, rs::kTrackStartAngle), "zero viewport");
    rs::ArcSegment n = ArcGeometryMapper::mapThumb(NAN, 1.0f);
    requireTrue(n.length == 0.0f, "NaN fraction");
    rs::ArcSegment full = ArcGeometryMapper::mapThumb(1.0f, 3.0f);
    requireTrue(near(full.length, rs::kTrackLength) && near(full.startAngle, rs::kTrackStartAngle),
                "full thumb fills the track");
    std::printf("  Test 5 (degenerate): PASS\n");
  }

  // ---- Test 6: arc rect ----
  {
    rs::ArcRect r = rs::arcRectForView(200.0f, 100.0f, 8.0f, 8.0f);
    requireTrue(r.cx == 100.0f && r.cy == 50.0f, "centered");
    requireTrue(r.width == 176.0f && r.height == 76.0f, "inset by padding and half stroke");
    rs::ArcRect tiny = rs::arcRectForView(10.0f, 10.0f, 8.0f, 8.0f);
    requireTrue(tiny.width == 0.0f && tiny.height == 0.0f, "floored at zero");
    std::printf("  Test 6 (rect): PASS\n");
  }

  std::printf("D2.2 arc geometry: ALL PASS\n");
  return 0;
}
