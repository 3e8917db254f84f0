#include "rs/scroll/PositionTracker.hpp"
#include "rs/geometry/ArcGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace rs {

const char* toString(PositionModel m) {
  return m == PositionModel::Paged ? "paged" : "continuous";
}

double PositionTracker::thumbFraction() const {
  TrackerMetrics m = metrics();
  return ArcGeometryMapper::fractionVisible(m.viewportExtent, m.maxExtent);
}

bool PositionTracker::isScrollable() const {
  TrackerMetrics m = metrics();
  return m.viewportExtent > 0.0 && m.maxExtent > 0.0;
}

// --- Continuous ---

ContinuousPositionTracker::ContinuousPositionTracker(ScrollSource& source)
  : source_(source) {
  sub_ = source_.addListener([this](const ScrollChange& c) { notify(c); });
}

ContinuousPositionTracker::~ContinuousPositionTracker() {
  source_.removeListener(sub_);
}

double ContinuousPositionTracker::currentFraction() const {
  double vp = source_.viewportExtent();
  return vp > 0.0 ? source_.offset() / vp : 0.0;
}

double ContinuousPositionTracker::position() const {
  return source_.offset();
}

double ContinuousPositionTracker::extentBefore() const {
  return std::max(0.0, source_.offset());
}

double ContinuousPositionTracker::extentAfter() const {
  return std::max(0.0, source_.maxExtent() - source_.offset());
}

double ContinuousPositionTracker::clampPosition(double position) const {
  if (!std::isfinite(position)) return source_.offset();
  return std::clamp(position, 0.0, std::max(0.0, source_.maxExtent()));
}

TrackerMetrics ContinuousPositionTracker::metrics() const {
  TrackerMetrics m;
  m.offset = source_.offset();
  m.viewportExtent = source_.viewportExtent();
  m.maxExtent = source_.maxExtent();
  return m;
}

void ContinuousPositionTracker::moveTo(double target, const MotionSpec& motion,
                                       MoveDoneCallback onDone) {
  source_.animateTo(target, motion, std::move(onDone));
}

// --- Paged ---

PagedPositionTracker::PagedPositionTracker(PageSource& source)
  : source_(source) {
  sub_ = source_.addListener([this](const ScrollChange& c) { notify(c); });
}

PagedPositionTracker::~PagedPositionTracker() {
  source_.removeListener(sub_);
}

double PagedPositionTracker::lastPage() const {
  return source_.pageCount() > 0 ? static_cast<double>(source_.pageCount() - 1) : 0.0;
}

double PagedPositionTracker::currentFraction() const {
  return source_.page();
}

double PagedPositionTracker::position() const {
  return std::trunc(source_.page());
}

double PagedPositionTracker::extentBefore() const {
  return std::max(0.0, std::round(source_.page()));
}

double PagedPositionTracker::extentAfter() const {
  return std::max(0.0, lastPage() - std::round(source_.page()));
}

double PagedPositionTracker::clampPosition(double position) const {
  if (!std::isfinite(position)) return std::trunc(source_.page());
  return std::clamp(std::round(position), 0.0, lastPage());
}

TrackerMetrics PagedPositionTracker::metrics() const {
  TrackerMetrics m;
  m.viewportExtent = source_.viewportExtent();
  m.offset = source_.page() * m.viewportExtent;
  m.maxExtent = lastPage() * m.viewportExtent;
  return m;
}

void PagedPositionTracker::moveTo(double target, const MotionSpec& motion,
                                  MoveDoneCallback onDone) {
  int page = static_cast<int>(clampPosition(target));
  source_.animateToPage(page, motion, std::move(onDone));
}

std::unique_ptr<PositionTracker> makePositionTracker(ScrollSource& source) {
  return std::make_unique<ContinuousPositionTracker>(source);
}

std::unique_ptr<PositionTracker> makePositionTracker(PageSource& source) {
  return std::make_unique<PagedPositionTracker>(source);
}

} // namespace rs
