#include "rs/visibility/VisibilityController.hpp"

namespace rs {

const char* toString(VisibilityState s) {
  switch (s) {
    case VisibilityState::Hidden:       return "hidden";
    case VisibilityState::Appearing:    return "appearing";
    case VisibilityState::Visible:      return "visible";
    case VisibilityState::Disappearing: return "disappearing";
  }
  return "hidden";
}

VisibilityController::VisibilityController(FrameScheduler& scheduler,
                                           const VisibilityConfig& config)
  : scheduler_(scheduler),
    config_(config),
    fade_(scheduler, config.fadeDurationMs, 0.0) {}

VisibilityController::~VisibilityController() {
  cancelHideTimer();
}

void VisibilityController::setConfig(const VisibilityConfig& config) {
  bool wasAutoHide = config_.autoHide;
  config_ = config;
  fade_.setDuration(config_.fadeDurationMs);

  if (!config_.autoHide) {
    cancelHideTimer();
  } else if (!wasAutoHide && scrollable_ && fade_.value() > 0.0) {
    armHideTimer();
  }
}

bool VisibilityController::onActivity() {
  if (!scrollable_) return false;

  VisibilityState s = state();
  if (s != VisibilityState::Visible && s != VisibilityState::Appearing) {
    fade_.forward();
  }
  armHideTimer();
  return true;
}

void VisibilityController::setScrollable(bool scrollable) {
  if (scrollable == scrollable_) return;
  scrollable_ = scrollable;
  if (scrollable_) return;

  cancelHideTimer();
  if (fade_.value() > 0.0) fade_.reverse();
}

VisibilityState VisibilityController::state() const {
  if (fade_.isAnimating()) {
    return fade_.status() == AnimationStatus::Reverse ? VisibilityState::Disappearing
                                                      : VisibilityState::Appearing;
  }
  return fade_.value() >= 1.0 ? VisibilityState::Visible : VisibilityState::Hidden;
}

float VisibilityController::opacity() const {
  return applyCurve(config_.fadeCurve, static_cast<float>(fade_.value()));
}

void VisibilityController::armHideTimer() {
  cancelHideTimer();
  if (!config_.autoHide) return;
  std::uint64_t gen = hideGeneration_;
  hideTimer_ = scheduler_.schedule(config_.autoHideDelayMs,
                                   [this, gen]() { onHideTimer(gen); });
}

void VisibilityController::cancelHideTimer() {
  ++hideGeneration_;
  if (hideTimer_ != kInvalidTimer) {
    scheduler_.cancel(hideTimer_);
    hideTimer_ = kInvalidTimer;
  }
}

void VisibilityController::onHideTimer(std::uint64_t generation) {
  // A stale timer must not hide a scrollbar re-armed by newer activity.
  if (generation != hideGeneration_) return;
  hideTimer_ = kInvalidTimer;
  if (!config_.autoHide) return;
  fade_.reverse();
}

} // namespace rs
