#pragma once
#include "rs/events/ListenerList.hpp"
#include "rs/math/Easing.hpp"
#include <functional>

namespace rs {

struct MotionSpec {
  double durationMs{0.0};
  Curve curve{Curve::Linear};
};

// Fired exactly once per requested move: on arrival, or when the move is
// superseded by a later move or a jump.
using MoveDoneCallback = std::function<void()>;

struct ScrollChange {
  bool positionChanged{false};
  bool metricsChanged{false};  // viewport or content extent
};

using ScrollListener = std::function<void(const ScrollChange&)>;

// Continuous scroll position in pixels along one axis.
class ScrollSource {
public:
  virtual ~ScrollSource() = default;

  virtual double offset() const = 0;
  virtual double viewportExtent() const = 0;
  virtual double maxExtent() const = 0;

  // Target is clamped to [0, maxExtent].
  virtual void animateTo(double offset, const MotionSpec& motion, MoveDoneCallback onDone) = 0;

  virtual ListenerId addListener(ScrollListener cb) = 0;
  virtual void removeListener(ListenerId id) = 0;
};

// Paged content. page() is fractional while a transition is in flight.
class PageSource {
public:
  virtual ~PageSource() = default;

  virtual double page() const = 0;
  virtual int pageCount() const = 0;
  virtual double viewportExtent() const = 0;

  // Target is clamped to [0, pageCount-1].
  virtual void animateToPage(int page, const MotionSpec& motion, MoveDoneCallback onDone) = 0;

  virtual ListenerId addListener(ScrollListener cb) = 0;
  virtual void removeListener(ListenerId id) = 0;
};

} // namespace rs
