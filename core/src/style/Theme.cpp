#include "rs/style/Theme.hpp"

namespace rs {

namespace {

void copyColor(float dst[4], const float src[4]) {
  for (int i = 0; i < 4; ++i) dst[i] = src[i];
}

} // namespace

Theme darkTheme() {
  Theme t;
  t.name = "dark";
  // Defaults in struct are already dark
  t.hasScrollbarTrackColor = true;
  t.scrollbarTrackColor[0] = 0.30f;
  t.scrollbarTrackColor[1] = 0.30f;
  t.scrollbarTrackColor[2] = 0.33f;
  t.scrollbarTrackColor[3] = 0.60f;
  t.hasScrollbarThumbColor = true;
  t.scrollbarThumbColor[0] = 0.85f;
  t.scrollbarThumbColor[1] = 0.85f;
  t.scrollbarThumbColor[2] = 0.90f;
  t.scrollbarThumbColor[3] = 1.0f;
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "light";
  t.backgroundColor[0] = 0.96f;
  t.backgroundColor[1] = 0.96f;
  t.backgroundColor[2] = 0.97f;
  t.backgroundColor[3] = 1.0f;
  // No scrollbar colors: track and thumb derive from the highlight.
  t.highlightColor[0] = 0.74f;
  t.highlightColor[1] = 0.74f;
  t.highlightColor[2] = 0.74f;
  t.highlightColor[3] = 0.4f;
  return t;
}

Theme themeByName(const std::string& name) {
  if (name == "light") return lightTheme();
  return darkTheme();
}

ScrollbarColors resolveScrollbarColors(const Theme& theme,
                                       const float* trackOverride,
                                       const float* thumbOverride) {
  ScrollbarColors c;

  if (trackOverride) copyColor(c.track, trackOverride);
  else if (theme.hasScrollbarTrackColor) copyColor(c.track, theme.scrollbarTrackColor);
  else copyColor(c.track, theme.highlightColor);

  if (thumbOverride) {
    copyColor(c.thumb, thumbOverride);
  } else if (theme.hasScrollbarThumbColor) {
    copyColor(c.thumb, theme.scrollbarThumbColor);
  } else {
    copyColor(c.thumb, theme.highlightColor);
    c.thumb[3] = 1.0f;
  }
  return c;
}

} // namespace rs
