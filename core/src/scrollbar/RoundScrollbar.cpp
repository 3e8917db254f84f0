#include "rs/scrollbar/RoundScrollbar.hpp"
#include <stdexcept>

namespace rs {

namespace {

const RoundScrollbarConfig& requireValid(const RoundScrollbarConfig& config) {
  ConfigResult r = validateConfig(config);
  if (!r.ok) throw std::invalid_argument(r.code + ": " + r.message);
  return config;
}

void copyColor(float dst[4], const float src[4]) {
  for (int i = 0; i < 4; ++i) dst[i] = src[i];
}

} // namespace

RoundScrollbar::RoundScrollbar(FrameScheduler& scheduler, ScrollSource& source,
                               const RoundScrollbarConfig& config,
                               RotaryEventSource* rotary, HapticActuator* haptics)
  : RoundScrollbar(scheduler, makePositionTracker(source), config, rotary, haptics) {}

RoundScrollbar::RoundScrollbar(FrameScheduler& scheduler, PageSource& source,
                               const RoundScrollbarConfig& config,
                               RotaryEventSource* rotary, HapticActuator* haptics)
  : RoundScrollbar(scheduler, makePositionTracker(source), config, rotary, haptics) {}

RoundScrollbar::RoundScrollbar(FrameScheduler& scheduler,
                               std::unique_ptr<PositionTracker> tracker,
                               const RoundScrollbarConfig& config,
                               RotaryEventSource* rotary, HapticActuator* haptics)
  : config_(requireValid(config)),
    theme_(darkTheme()),
    tracker_(std::move(tracker)),
    visibility_(scheduler, toVisibilityConfig(config_)) {
  resolveColors();
  updateThumb();

  trackerSub_ = tracker_->addListener([this](const ScrollChange& c) { onTrackerChange(c); });

  if (rotary) {
    rotary_ = std::make_unique<RotaryInputController>(scheduler, *tracker_, *rotary, haptics,
                                                      toRotaryConfig(config_));
    rotary_->setActivityCallback([this]() { visibility_.onActivity(); });
  }

  // Becoming scrollable on first layout counts as activity.
  lastViewportExtent_ = tracker_->metrics().viewportExtent;
  visibility_.setScrollable(tracker_->isScrollable());
  visibility_.onActivity();
}

RoundScrollbar::~RoundScrollbar() {
  rotary_.reset();
  tracker_->removeListener(trackerSub_);
}

void RoundScrollbar::updateConfig(const RoundScrollbarConfig& config) {
  config_ = requireValid(config);
  visibility_.setConfig(toVisibilityConfig(config_));
  if (rotary_) rotary_->setConfig(toRotaryConfig(config_));
  resolveColors();
}

void RoundScrollbar::setTheme(const Theme& theme) {
  theme_ = theme;
  resolveColors();
}

void RoundScrollbar::resolveColors() {
  colors_ = resolveScrollbarColors(theme_,
                                   config_.hasTrackColor ? config_.trackColor : nullptr,
                                   config_.hasThumbColor ? config_.thumbColor : nullptr);
}

void RoundScrollbar::updateThumb() {
  thumb_ = ArcGeometryMapper::mapThumb(static_cast<float>(tracker_->thumbFraction()),
                                       static_cast<float>(tracker_->currentFraction()));
}

void RoundScrollbar::onTrackerChange(const ScrollChange& change) {
  bool wasScrollable = visibility_.isScrollable();
  bool scrollable = tracker_->isScrollable();
  visibility_.setScrollable(scrollable);
  updateThumb();

  bool activity = change.positionChanged;
  if (change.metricsChanged) {
    double vp = tracker_->metrics().viewportExtent;
    if (vp != lastViewportExtent_ || (scrollable && !wasScrollable)) activity = true;
    lastViewportExtent_ = vp;
  }
  if (activity) visibility_.onActivity();
}

ScrollbarFrame RoundScrollbar::frame() const {
  ScrollbarFrame f;
  f.track = ArcGeometryMapper::mapTrack();
  f.track.colorAlphaScale = colors_.track[3];
  f.thumb = thumb_;
  f.thumb.colorAlphaScale = colors_.thumb[3];
  f.opacity = visibility_.opacity();
  f.padding = config_.padding;
  f.strokeWidth = config_.strokeWidth;
  copyColor(f.trackColor, colors_.track);
  copyColor(f.thumbColor, colors_.thumb);
  return f;
}

bool RoundScrollbar::needsPaint() const {
  return !painted_ || shouldRepaint(lastPainted_, frame());
}

bool RoundScrollbar::paint(ArcPainter& painter) {
  ScrollbarFrame f = frame();
  if (painted_ && !shouldRepaint(lastPainted_, f)) return false;
  painter.paint(f);
  lastPainted_ = f;
  painted_ = true;
  return true;
}

} // namespace rs
