#pragma once
#include "rs/scrollbar/ScrollbarFrame.hpp"

namespace rs {

// Draws a scrollbar frame: track first, thumb on top, round caps.
class ArcPainter {
public:
  virtual ~ArcPainter() = default;
  virtual void paint(const ScrollbarFrame& frame) = 0;
};

} // namespace rs
