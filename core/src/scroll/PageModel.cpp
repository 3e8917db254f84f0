#include "rs/scroll/PageModel.hpp"
#include <algorithm>
#include <cmath>

namespace rs {

PageModel::PageModel(FrameScheduler& scheduler, int pageCount, double viewportExtent,
                     int initialPage)
  : anim_(scheduler, 0.0),
    pageCount_(std::max(0, pageCount)),
    viewport_(std::max(0.0, viewportExtent)),
    page_(0.0) {
  page_ = std::clamp(static_cast<double>(initialPage), 0.0, lastPage());
  anim_.addListener([this]() { onAnimTick(); });
}

double PageModel::lastPage() const {
  return pageCount_ > 0 ? static_cast<double>(pageCount_ - 1) : 0.0;
}

void PageModel::animateToPage(int page, const MotionSpec& motion, MoveDoneCallback onDone) {
  double target = std::clamp(static_cast<double>(page), 0.0, lastPage());

  // Pin the interpolation so the reset below leaves the position alone.
  from_ = page_;
  to_ = page_;
  anim_.setValue(0.0);
  to_ = target;
  curve_ = motion.curve;
  anim_.animateTo(1.0, motion.durationMs, [cb = std::move(onDone)](bool) {
    if (cb) cb();
  });
}

void PageModel::jumpToPage(double page) {
  if (!std::isfinite(page)) return;
  anim_.stop();
  setPage(std::clamp(page, 0.0, lastPage()), false);
}

void PageModel::setPageCount(int count) {
  int n = std::max(0, count);
  if (n == pageCount_) return;
  pageCount_ = n;
  if (to_ > lastPage()) to_ = lastPage();
  setPage(std::min(page_, lastPage()), true);
}

void PageModel::setViewportExtent(double viewportExtent) {
  double vp = std::max(0.0, viewportExtent);
  if (vp == viewport_) return;
  viewport_ = vp;
  setPage(page_, true);
}

void PageModel::onAnimTick() {
  double t = applyCurve(curve_, static_cast<float>(anim_.value()));
  setPage(from_ + (to_ - from_) * t, false);
}

void PageModel::setPage(double next, bool metricsChanged) {
  ScrollChange change;
  change.positionChanged = next != page_;
  change.metricsChanged = metricsChanged;
  page_ = next;
  if (change.positionChanged || change.metricsChanged) listeners_.notify(change);
}

} // namespace rs
