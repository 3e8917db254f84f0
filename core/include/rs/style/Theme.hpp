#pragma once
#include <string>

namespace rs {

struct Theme {
  std::string name;

  float backgroundColor[4] = {0.0f, 0.0f, 0.0f, 1.0f};

  // Generic highlight; the scrollbar falls back to it.
  float highlightColor[4] = {0.8f, 0.8f, 0.8f, 0.25f};

  // Scrollbar-specific colors, used when set.
  bool hasScrollbarTrackColor{false};
  float scrollbarTrackColor[4] = {0.0f, 0.0f, 0.0f, 0.0f};
  bool hasScrollbarThumbColor{false};
  float scrollbarThumbColor[4] = {0.0f, 0.0f, 0.0f, 0.0f};
};

// Built-in presets
Theme darkTheme();
Theme lightTheme();

// Returns darkTheme() for unknown names.
Theme themeByName(const std::string& name);

struct ScrollbarColors {
  float track[4] = {0.0f, 0.0f, 0.0f, 0.0f};
  float thumb[4] = {0.0f, 0.0f, 0.0f, 0.0f};
};

// Per color: explicit override, then the theme's scrollbar color, then the
// highlight color (forced opaque for the thumb). Overrides may be null.
ScrollbarColors resolveScrollbarColors(const Theme& theme,
                                       const float* trackOverride,
                                       const float* thumbOverride);

} // namespace rs
