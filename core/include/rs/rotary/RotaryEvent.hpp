#pragma once
#include <cstdint>

namespace rs {

enum class RotaryDirection : std::uint8_t { Clockwise, CounterClockwise };

// One detent of a crown or bezel.
struct RotaryEvent {
  RotaryDirection direction{RotaryDirection::Clockwise};
};

// Clockwise scrolls forward (+1).
inline int directionSign(RotaryDirection d) {
  return d == RotaryDirection::Clockwise ? 1 : -1;
}

inline const char* toString(RotaryDirection d) {
  return d == RotaryDirection::Clockwise ? "cw" : "ccw";
}

} // namespace rs
