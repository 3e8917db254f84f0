#pragma once
#include "rs/math/Easing.hpp"
#include "rs/rotary/RotaryInputController.hpp"
#include "rs/visibility/VisibilityController.hpp"
#include <string>

namespace rs {

struct RoundScrollbarConfig {
  // Layout (pixels)
  float padding{8.0f};
  float strokeWidth{8.0f};

  // Visibility
  bool autoHide{true};
  Curve opacityCurve{Curve::EaseInOut};
  double opacityDurationMs{250.0};
  double autoHideDelayMs{3000.0};

  // Color overrides (otherwise resolved from the theme)
  bool hasTrackColor{false};
  float trackColor[4] = {0.0f, 0.0f, 0.0f, 0.0f};
  bool hasThumbColor{false};
  float thumbColor[4] = {0.0f, 0.0f, 0.0f, 0.0f};

  // Rotary input
  bool hapticFeedback{true};
  double pageTransitionDurationMs{250.0};
  Curve pageTransitionCurve{Curve::EaseInOutCirc};
  double scrollAnimationDurationMs{100.0};
  Curve scrollAnimationCurve{Curve::Linear};
  double scrollMagnitude{50.0};
};

struct ConfigResult {
  bool ok{true};
  std::string code;     // e.g. "BAD_PADDING"
  std::string message;
};

ConfigResult validateConfig(const RoundScrollbarConfig& config);

VisibilityConfig toVisibilityConfig(const RoundScrollbarConfig& config);
RotaryInputConfig toRotaryConfig(const RoundScrollbarConfig& config);

// JSON round-trip. Absent keys keep their defaults; a present key of the
// wrong type, an unknown curve name, or a malformed color fails the whole
// parse and leaves `out` untouched.
std::string serializeScrollbarConfig(const RoundScrollbarConfig& config);
bool deserializeScrollbarConfig(const std::string& json, RoundScrollbarConfig& out);

} // namespace rs
