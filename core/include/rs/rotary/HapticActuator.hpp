#pragma once

namespace rs {

inline constexpr int kRotaryHapticDurationMs = 25;
inline constexpr int kRotaryHapticAmplitude = 64;

// Platform vibration motor. Hosts without one report hasVibrator() == false.
class HapticActuator {
public:
  virtual ~HapticActuator() = default;

  virtual bool hasVibrator() const { return true; }

  // Fire-and-forget. amplitude is 1..255.
  virtual void vibrate(int durationMs, int amplitude) = 0;
};

} // namespace rs
