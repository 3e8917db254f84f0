#pragma once
#include "rs/rotary/HapticActuator.hpp"
#include "rs/rotary/RotaryEventSource.hpp"
#include "rs/scroll/PositionTracker.hpp"
#include "rs/timing/FrameScheduler.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace rs {

struct RotaryInputConfig {
  bool hapticFeedback{true};
  double scrollMagnitude{50.0};                          // pixels per tick (continuous)
  MotionSpec scrollMotion{100.0, Curve::Linear};         // continuous
  MotionSpec pageMotion{250.0, Curve::EaseInOutCirc};    // paged
  double edgeCooldownMs{1000.0};
};

// Turns rotary ticks into moves on a PositionTracker.
//
// Ticks accumulate on a locally held position estimate, so a fast burst of N
// ticks targets N steps away rather than re-deriving from a position that is
// still animating. Every move bumps an epoch; only the completion of the
// newest move clears the animating flag, and only while not animating does the
// estimate follow the tracker. At an edge, the first tick bumps (one move plus
// a haptic pulse) and starts a cooldown during which further ticks towards
// that edge are dropped.
class RotaryInputController {
public:
  // haptics may be null. Subscribes to both rotary and tracker.
  RotaryInputController(FrameScheduler& scheduler, PositionTracker& tracker,
                        RotaryEventSource& rotary, HapticActuator* haptics,
                        const RotaryInputConfig& config);
  ~RotaryInputController();

  RotaryInputController(const RotaryInputController&) = delete;
  RotaryInputController& operator=(const RotaryInputController&) = delete;

  void setConfig(const RotaryInputConfig& config);
  const RotaryInputConfig& config() const { return config_; }

  // Called for accepted edge ticks so the host can reveal the scrollbar.
  void setActivityCallback(std::function<void()> cb) { onActivity_ = std::move(cb); }

  void handleTick(const RotaryEvent& event);

  double positionEstimate() const { return estimate_; }
  std::uint64_t epoch() const { return epoch_; }
  bool isAnimating() const { return animating_; }
  bool edgeCooldownActive() const { return edgeCooldown_; }
  std::uint64_t acceptedTicks() const { return acceptedTicks_; }
  std::uint64_t droppedTicks() const { return droppedTicks_; }

private:
  void applyConfig();
  bool atEdge(RotaryDirection direction) const;
  void moveAndVibrate(double next);
  void onMoveDone(std::uint64_t moveEpoch);
  void onTrackerChange();
  void armEdgeCooldown();
  void cancelEdgeCooldown();
  void vibrate();

  FrameScheduler& scheduler_;
  PositionTracker& tracker_;
  RotaryEventSource& rotary_;
  HapticActuator* haptics_;
  RotaryInputConfig config_;

  // Resolved once per config from the tracker variant.
  double step_{0.0};
  MotionSpec motion_;

  double estimate_{0.0};
  std::uint64_t epoch_{0};
  bool animating_{false};

  bool edgeCooldown_{false};
  TimerId cooldownTimer_{kInvalidTimer};
  std::uint64_t cooldownGeneration_{0};

  std::uint64_t acceptedTicks_{0};
  std::uint64_t droppedTicks_{0};
  bool noVibratorLogged_{false};

  SubscriptionId rotarySub_{0};
  ListenerId trackerSub_{0};
  std::function<void()> onActivity_;

  // Move completions can outlive us inside the scroll source.
  std::shared_ptr<bool> alive_;
};

} // namespace rs
