#pragma once
#include "rs/anim/AnimationController.hpp"
#include "rs/events/ListenerList.hpp"
#include "rs/math/Easing.hpp"
#include "rs/timing/FrameScheduler.hpp"
#include <cstdint>
#include <functional>

namespace rs {

enum class VisibilityState : std::uint8_t { Hidden, Appearing, Visible, Disappearing };

const char* toString(VisibilityState s);

struct VisibilityConfig {
  bool autoHide{true};
  double fadeDurationMs{250.0};
  Curve fadeCurve{Curve::EaseInOut};
  double autoHideDelayMs{3000.0};
};

// Fade state machine for the scrollbar. Activity fades it in and (with
// autoHide) re-arms a single hide timer, which fades it out again.
// Opacity is fadeCurve(progress), so reversals stay continuous.
class VisibilityController {
public:
  VisibilityController(FrameScheduler& scheduler, const VisibilityConfig& config);
  ~VisibilityController();

  VisibilityController(const VisibilityController&) = delete;
  VisibilityController& operator=(const VisibilityController&) = delete;

  void setConfig(const VisibilityConfig& config);
  const VisibilityConfig& config() const { return config_; }

  // Returns false if suppressed because the content cannot scroll.
  bool onActivity();

  // Losing scrollability fades out and disarms the hide timer.
  void setScrollable(bool scrollable);
  bool isScrollable() const { return scrollable_; }

  VisibilityState state() const;
  float opacity() const;
  double progress() const { return fade_.value(); }
  bool hideTimerArmed() const { return hideTimer_ != kInvalidTimer; }

  // Fires on every opacity change.
  ListenerId addListener(std::function<void()> cb) { return fade_.addListener(std::move(cb)); }
  void removeListener(ListenerId id) { fade_.removeListener(id); }

private:
  void armHideTimer();
  void cancelHideTimer();
  void onHideTimer(std::uint64_t generation);

  FrameScheduler& scheduler_;
  VisibilityConfig config_;
  AnimationController fade_;
  bool scrollable_{false};
  TimerId hideTimer_{kInvalidTimer};
  std::uint64_t hideGeneration_{0};
};

} // namespace rs
