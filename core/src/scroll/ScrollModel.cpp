#include "rs/scroll/ScrollModel.hpp"
#include <algorithm>
#include <cmath>

namespace rs {

ScrollModel::ScrollModel(FrameScheduler& scheduler, double viewportExtent, double maxExtent,
                         double offset)
  : anim_(scheduler, 0.0),
    offset_(offset),
    viewport_(std::max(0.0, viewportExtent)),
    max_(std::max(0.0, maxExtent)) {
  anim_.addListener([this]() { onAnimTick(); });
}

void ScrollModel::animateTo(double offset, const MotionSpec& motion, MoveDoneCallback onDone) {
  double target = std::isfinite(offset) ? std::clamp(offset, 0.0, max_) : offset_;

  // Pin the interpolation so the reset below leaves the position alone.
  from_ = offset_;
  to_ = offset_;
  anim_.setValue(0.0);
  to_ = target;
  curve_ = motion.curve;
  anim_.animateTo(1.0, motion.durationMs, [cb = std::move(onDone)](bool) {
    if (cb) cb();
  });
}

void ScrollModel::jumpTo(double offset) {
  if (!std::isfinite(offset)) return;
  anim_.stop();
  setOffset(offset, false);
}

void ScrollModel::setMetrics(double viewportExtent, double maxExtent) {
  double vp = std::max(0.0, viewportExtent);
  double mx = std::max(0.0, maxExtent);
  if (vp == viewport_ && mx == max_) return;
  viewport_ = vp;
  max_ = mx;
  if (to_ > max_) to_ = max_;
  setOffset(offset_ > max_ ? max_ : offset_, true);
}

void ScrollModel::onAnimTick() {
  double t = applyCurve(curve_, static_cast<float>(anim_.value()));
  setOffset(from_ + (to_ - from_) * t, false);
}

void ScrollModel::setOffset(double next, bool metricsChanged) {
  ScrollChange change;
  change.positionChanged = next != offset_;
  change.metricsChanged = metricsChanged;
  offset_ = next;
  if (change.positionChanged || change.metricsChanged) listeners_.notify(change);
}

} // namespace rs
