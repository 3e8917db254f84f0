#pragma once
#include "rs/anim/AnimationController.hpp"
#include "rs/scroll/ScrollSource.hpp"

namespace rs {

// Reference PageSource: a horizontal/vertical pager.
class PageModel : public PageSource {
public:
  PageModel(FrameScheduler& scheduler, int pageCount, double viewportExtent,
            int initialPage = 0);

  double page() const override { return page_; }
  int pageCount() const override { return pageCount_; }
  double viewportExtent() const override { return viewport_; }

  void animateToPage(int page, const MotionSpec& motion, MoveDoneCallback onDone) override;

  ListenerId addListener(ScrollListener cb) override { return listeners_.add(std::move(cb)); }
  void removeListener(ListenerId id) override { listeners_.remove(id); }

  // Immediate move (fractional pages allowed, e.g. mid-swipe).
  void jumpToPage(double page);

  void setPageCount(int count);
  void setViewportExtent(double viewportExtent);

  bool isAnimating() const { return anim_.isAnimating(); }
  std::size_t listenerCount() const { return listeners_.size(); }

private:
  void onAnimTick();
  void setPage(double next, bool metricsChanged);
  double lastPage() const;

  AnimationController anim_;
  int pageCount_;
  double viewport_;
  double page_;
  double from_{0.0};
  double to_{0.0};
  Curve curve_{Curve::Linear};
  ListenerList<const ScrollChange&> listeners_;
};

} // namespace rs
