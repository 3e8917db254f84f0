#include "rs/anim/AnimationController.hpp"
#include <algorithm>
#include <cmath>

namespace rs {

namespace {

double clamp01(double v) {
  if (!std::isfinite(v)) return 0.0;
  return std::clamp(v, 0.0, 1.0);
}

double sanitizeDuration(double ms) {
  return std::isfinite(ms) ? std::max(0.0, ms) : 0.0;
}

AnimationStatus restingStatus(double value) {
  return value >= 1.0 ? AnimationStatus::Completed : AnimationStatus::Dismissed;
}

} // namespace

const char* toString(AnimationStatus s) {
  switch (s) {
    case AnimationStatus::Dismissed: return "dismissed";
    case AnimationStatus::Forward:   return "forward";
    case AnimationStatus::Reverse:   return "reverse";
    case AnimationStatus::Completed: return "completed";
  }
  return "dismissed";
}

AnimationController::AnimationController(FrameScheduler& scheduler, double durationMs,
                                         double initialValue)
  : scheduler_(scheduler),
    durationMs_(sanitizeDuration(durationMs)),
    value_(clamp01(initialValue)) {
  status_ = restingStatus(value_);
}

AnimationController::~AnimationController() {
  detachTicker();
}

void AnimationController::setDuration(double durationMs) {
  durationMs_ = sanitizeDuration(durationMs);
}

void AnimationController::forward(DoneCallback onDone) {
  // Already heading there; keep the existing run.
  if (animating_ && status_ == AnimationStatus::Forward && to_ >= 1.0 && !onDone) return;
  start(1.0, durationMs_ * (1.0 - value_), AnimationStatus::Forward, std::move(onDone));
}

void AnimationController::reverse(DoneCallback onDone) {
  if (animating_ && status_ == AnimationStatus::Reverse && to_ <= 0.0 && !onDone) return;
  start(0.0, durationMs_ * value_, AnimationStatus::Reverse, std::move(onDone));
}

void AnimationController::animateTo(double target, double durationMs, DoneCallback onDone) {
  double t = clamp01(target);
  AnimationStatus dir = t >= value_ ? AnimationStatus::Forward : AnimationStatus::Reverse;
  start(t, sanitizeDuration(durationMs), dir, std::move(onDone));
}

void AnimationController::stop() {
  if (!animating_) return;
  animating_ = false;
  detachTicker();
  DoneCallback cb = takeDone();
  if (cb) cb(false);
}

void AnimationController::setValue(double v) {
  stop();
  double next = clamp01(v);
  status_ = restingStatus(next);
  if (next == value_) return;
  value_ = next;
  listeners_.notify();
}

AnimationController::DoneCallback AnimationController::takeDone() {
  DoneCallback cb = std::move(onDone_);
  onDone_ = nullptr;
  return cb;
}

void AnimationController::detachTicker() {
  if (ticker_ != 0) {
    scheduler_.removeTicker(ticker_);
    ticker_ = 0;
  }
}

void AnimationController::start(double target, double runMs, AnimationStatus direction,
                                DoneCallback onDone) {
  // Supersede the active run first so its owner observes the interruption
  // before the new run is installed.
  if (animating_) {
    animating_ = false;
    detachTicker();
    DoneCallback prev = takeDone();
    if (prev) prev(false);
  }

  from_ = value_;
  to_ = target;
  runMs_ = sanitizeDuration(runMs);
  startMs_ = scheduler_.nowMs();
  status_ = direction;
  onDone_ = std::move(onDone);
  animating_ = true;

  if (runMs_ <= 0.0 || from_ == to_) {
    bool changed = value_ != to_;
    value_ = to_;
    if (changed) listeners_.notify();
    if (animating_) finish(true);
    return;
  }

  ticker_ = scheduler_.addTicker([this](double nowMs) { onTick(nowMs); });
}

void AnimationController::onTick(double nowMs) {
  if (!animating_) return;
  double t = std::clamp((nowMs - startMs_) / runMs_, 0.0, 1.0);
  double next = t >= 1.0 ? to_ : from_ + (to_ - from_) * t;
  if (next != value_) {
    value_ = next;
    listeners_.notify();
  }
  if (t >= 1.0 && animating_) finish(true);
}

void AnimationController::finish(bool completed) {
  animating_ = false;
  detachTicker();
  if (value_ >= 1.0) status_ = AnimationStatus::Completed;
  else if (value_ <= 0.0) status_ = AnimationStatus::Dismissed;
  else status_ = status_ == AnimationStatus::Forward ? AnimationStatus::Completed
                                                     : AnimationStatus::Dismissed;
  DoneCallback cb = takeDone();
  if (cb) cb(completed);
}

} // namespace rs
