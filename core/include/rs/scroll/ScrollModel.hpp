#pragma once
#include "rs/anim/AnimationController.hpp"
#include "rs/scroll/ScrollSource.hpp"

namespace rs {

// Reference ScrollSource: a scrollable list driven by the FrameScheduler.
class ScrollModel : public ScrollSource {
public:
  ScrollModel(FrameScheduler& scheduler, double viewportExtent, double maxExtent,
              double offset = 0.0);

  double offset() const override { return offset_; }
  double viewportExtent() const override { return viewport_; }
  double maxExtent() const override { return max_; }

  void animateTo(double offset, const MotionSpec& motion, MoveDoneCallback onDone) override;

  ListenerId addListener(ScrollListener cb) override { return listeners_.add(std::move(cb)); }
  void removeListener(ListenerId id) override { listeners_.remove(id); }

  // Immediate move (e.g. a touch drag). Completes any in-flight animation.
  // Not clamped, so hosts can express overscroll.
  void jumpTo(double offset);

  // A shrinking maxExtent pulls the offset back inside the new range.
  void setMetrics(double viewportExtent, double maxExtent);

  bool isAnimating() const { return anim_.isAnimating(); }
  std::size_t listenerCount() const { return listeners_.size(); }

private:
  void onAnimTick();
  void setOffset(double next, bool metricsChanged);

  AnimationController anim_;
  double offset_;
  double viewport_;
  double max_;
  double from_{0.0};
  double to_{0.0};
  Curve curve_{Curve::Linear};
  ListenerList<const ScrollChange&> listeners_;
};

} // namespace rs
