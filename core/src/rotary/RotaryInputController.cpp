#include "rs/rotary/RotaryInputController.hpp"
#include <cstdio>

namespace rs {

RotaryInputController::RotaryInputController(FrameScheduler& scheduler,
                                             PositionTracker& tracker,
                                             RotaryEventSource& rotary,
                                             HapticActuator* haptics,
                                             const RotaryInputConfig& config)
  : scheduler_(scheduler),
    tracker_(tracker),
    rotary_(rotary),
    haptics_(haptics),
    config_(config),
    alive_(std::make_shared<bool>(true)) {
  applyConfig();
  estimate_ = tracker_.position();
  trackerSub_ = tracker_.addListener([this](const ScrollChange&) { onTrackerChange(); });
  rotarySub_ = rotary_.subscribe([this](const RotaryEvent& e) { handleTick(e); });
}

RotaryInputController::~RotaryInputController() {
  rotary_.unsubscribe(rotarySub_);
  tracker_.removeListener(trackerSub_);
  cancelEdgeCooldown();
  alive_.reset();
}

void RotaryInputController::setConfig(const RotaryInputConfig& config) {
  config_ = config;
  applyConfig();
}

void RotaryInputController::applyConfig() {
  if (tracker_.model() == PositionModel::Paged) {
    step_ = 1.0;
    motion_ = config_.pageMotion;
  } else {
    step_ = config_.scrollMagnitude;
    motion_ = config_.scrollMotion;
  }
}

void RotaryInputController::handleTick(const RotaryEvent& event) {
  if (atEdge(event.direction)) {
    if (edgeCooldown_) {
      ++droppedTicks_;
      return;
    }
    armEdgeCooldown();
    if (onActivity_) onActivity_();
  }

  double next = estimate_ + directionSign(event.direction) * step_;
  moveAndVibrate(next);
}

bool RotaryInputController::atEdge(RotaryDirection direction) const {
  return direction == RotaryDirection::Clockwise ? tracker_.extentAfter() <= 0.0
                                                 : tracker_.extentBefore() <= 0.0;
}

void RotaryInputController::moveAndVibrate(double next) {
  animating_ = true;
  std::uint64_t moveEpoch = ++epoch_;
  std::weak_ptr<bool> alive = alive_;
  tracker_.moveTo(next, motion_, [this, alive, moveEpoch]() {
    if (alive.expired()) return;
    onMoveDone(moveEpoch);
  });
  estimate_ = tracker_.clampPosition(next);
  ++acceptedTicks_;
  vibrate();
}

void RotaryInputController::onMoveDone(std::uint64_t moveEpoch) {
  // Superseded moves complete too; only the newest one ends the burst.
  if (moveEpoch != epoch_) return;
  animating_ = false;
}

void RotaryInputController::onTrackerChange() {
  if (animating_) return;
  estimate_ = tracker_.position();
}

void RotaryInputController::armEdgeCooldown() {
  cancelEdgeCooldown();
  edgeCooldown_ = true;
  std::uint64_t gen = cooldownGeneration_;
  cooldownTimer_ = scheduler_.schedule(config_.edgeCooldownMs, [this, gen]() {
    if (gen != cooldownGeneration_) return;
    cooldownTimer_ = kInvalidTimer;
    edgeCooldown_ = false;
  });
}

void RotaryInputController::cancelEdgeCooldown() {
  ++cooldownGeneration_;
  if (cooldownTimer_ != kInvalidTimer) {
    scheduler_.cancel(cooldownTimer_);
    cooldownTimer_ = kInvalidTimer;
  }
  edgeCooldown_ = false;
}

void RotaryInputController::vibrate() {
  if (!config_.hapticFeedback || haptics_ == nullptr) return;
  if (!haptics_->hasVibrator()) {
    if (!noVibratorLogged_) {
      std::fprintf(stderr, "RotaryInputController: no vibrator, haptics skipped\n");
      noVibratorLogged_ = true;
    }
    return;
  }
  haptics_->vibrate(kRotaryHapticDurationMs, kRotaryHapticAmplitude);
}

} // namespace rs
