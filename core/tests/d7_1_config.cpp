// D7.1: scrollbar config validation and JSON

#include "rs/config/ScrollbarConfig.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: defaults ----
  {
    rs::RoundScrollbarConfig c;
    requireTrue(rs::validateConfig(c).ok, "defaults valid");
    requireTrue(c.padding == 8.0f && c.strokeWidth == 8.0f, "layout defaults");
    requireTrue(c.autoHide && c.opacityDurationMs == 250.0 && c.autoHideDelayMs == 3000.0,
                "visibility defaults");
    requireTrue(c.opacityCurve == rs::Curve::EaseInOut, "opacity curve");
    requireTrue(c.hapticFeedback && c.scrollMagnitude == 50.0, "rotary defaults");
    requireTrue(c.pageTransitionDurationMs == 250.0 &&
                c.pageTransitionCurve == rs::Curve::EaseInOutCirc, "page transition");
    requireTrue(c.scrollAnimationDurationMs == 100.0 &&
                c.scrollAnimationCurve == rs::Curve::Linear, "scroll animation");
    std::printf("  Test 1 (defaults): PASS\n");
  }

  // ---- Test 2: validation errors ----
  {
    rs::RoundScrollbarConfig c;
    c.padding = -1.0f;
    requireTrue(rs::validateConfig(c).code == "BAD_PADDING", "negative padding");

    c = rs::RoundScrollbarConfig{};
    c.strokeWidth = NAN;
    requireTrue(rs::validateConfig(c).code == "BAD_STROKE_WIDTH", "NaN stroke");

    c = rs::RoundScrollbarConfig{};
    c.autoHideDelayMs = -5.0;
    requireTrue(rs::validateConfig(c).code == "BAD_DURATION", "negative delay");

    c = rs::RoundScrollbarConfig{};
    c.scrollMagnitude = 0.0;
    requireTrue(rs::validateConfig(c).code == "BAD_SCROLL_MAGNITUDE", "zero magnitude");

    c = rs::RoundScrollbarConfig{};
    c.hasThumbColor = true;
    c.thumbColor[3] = 1.5f;
    rs::ConfigResult r = rs::validateConfig(c);
    requireTrue(!r.ok && r.code == "BAD_COLOR" && !r.message.empty(), "bad color");
    c.hasThumbColor = false;
    requireTrue(rs::validateConfig(c).ok, "unset color not validated");
    std::printf("  Test 2 (validation): PASS\n");
  }

  // ---- Test 3: derived component configs ----
  {
    rs::RoundScrollbarConfig c;
    c.autoHide = false;
    c.opacityDurationMs = 120.0;
    c.opacityCurve = rs::Curve::Linear;
    c.hapticFeedback = false;
    c.scrollMagnitude = 80.0;
    c.pageTransitionDurationMs = 300.0;
    rs::VisibilityConfig v = rs::toVisibilityConfig(c);
    requireTrue(!v.autoHide && v.fadeDurationMs == 120.0 && v.fadeCurve == rs::Curve::Linear,
                "visibility config");
    rs::RotaryInputConfig ri = rs::toRotaryConfig(c);
    requireTrue(!ri.hapticFeedback && ri.scrollMagnitude == 80.0, "rotary config");
    requireTrue(ri.pageMotion.durationMs == 300.0 && ri.scrollMotion.durationMs == 100.0, "motions");
    requireTrue(ri.edgeCooldownMs == 1000.0, "fixed cooldown");
    std::printf("  Test 3 (derived): PASS\n");
  }

  // ---- Test 4: JSON ----
  {
    rs::RoundScrollbarConfig c;
    c.padding = 12.0f;
    c.hasTrackColor = true;
    c.trackColor[0] = 0.5f;
    c.trackColor[3] = 0.25f;
    c.pageTransitionCurve = rs::Curve::FastOutSlowIn;
    std::string json = rs::serializeScrollbarConfig(c);
    requireTrue(json.find("\"trackColor\"") != std::string::npos, "track color written");
    requireTrue(json.find("\"thumbColor\"") == std::string::npos, "unset thumb color omitted");
    requireTrue(json.find("fastOutSlowIn") != std::string::npos, "curve by name");

    rs::RoundScrollbarConfig back;
    requireTrue(rs::deserializeScrollbarConfig(json, back), "parses");
    requireTrue(back.padding == 12.0f && back.hasTrackColor && back.trackColor[3] == 0.25f,
                "values restored");
    requireTrue(back.pageTransitionCurve == rs::Curve::FastOutSlowIn, "curve restored");

    rs::RoundScrollbarConfig partial;
    requireTrue(rs::deserializeScrollbarConfig(R"({"scrollMagnitude":75,"trackColor":null})", partial),
                "partial document");
    requireTrue(partial.scrollMagnitude == 75.0 && partial.padding == 8.0f, "absent keys keep defaults");
    std::printf("  Test 4 (json): PASS\n");
  }

  // ---- Test 5: malformed JSON leaves the config untouched ----
  {
    rs::RoundScrollbarConfig c;
    c.padding = 3.0f;
    const char* bad[] = {
      "{",
      "[1,2]",
      R"({"padding":"wide"})",
      R"({"autoHide":1})",
      R"({"opacityAnimation":{"curve":"bounce"}})",
      R"({"thumbColor":[1,1,1]})",
      R"({"padding":20,"pageTransition":{"durationMs":"slow"}})",
    };
    for (const char* json : bad) {
      requireTrue(!rs::deserializeScrollbarConfig(json, c), json);
      requireTrue(c.padding == 3.0f, "unchanged after failure");
    }
    std::printf("  Test 5 (malformed): PASS\n");
  }

  std::printf("D7.1 config: ALL PASS\n");
  return 0;
}
