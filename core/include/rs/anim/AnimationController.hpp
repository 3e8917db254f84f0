#pragma once
#include "rs/events/ListenerList.hpp"
#include "rs/timing/FrameScheduler.hpp"
#include <cstdint>
#include <functional>

namespace rs {

enum class AnimationStatus : std::uint8_t {
  Dismissed,  // at rest at 0
  Forward,    // running towards 1 (or a higher target)
  Reverse,    // running towards 0 (or a lower target)
  Completed   // at rest at 1
};

const char* toString(AnimationStatus s);

// Linear value driver in [0,1] ticked by a FrameScheduler. Curves are applied
// by the consumer. At most one run is active; starting a new one supersedes
// the old run, whose done callback receives completed=false.
class AnimationController {
public:
  using Listener = std::function<void()>;
  using DoneCallback = std::function<void(bool completed)>;

  AnimationController(FrameScheduler& scheduler, double durationMs,
                      double initialValue = 0.0);
  ~AnimationController();

  AnimationController(const AnimationController&) = delete;
  AnimationController& operator=(const AnimationController&) = delete;

  double value() const { return value_; }
  AnimationStatus status() const { return status_; }
  bool isAnimating() const { return animating_; }

  double durationMs() const { return durationMs_; }
  // Applies to runs started afterwards.
  void setDuration(double durationMs);

  // Run to 1 (forward) or 0 (reverse) from the current value. Time is scaled
  // by the remaining distance so a reversal mid-run stays continuous.
  void forward(DoneCallback onDone = {});
  void reverse(DoneCallback onDone = {});

  // Run to target over exactly durationMs. Zero duration jumps synchronously.
  void animateTo(double target, double durationMs, DoneCallback onDone = {});

  // Halts at the current value; the pending done callback gets false.
  void stop();

  // Jumps without animating. Stops any active run.
  void setValue(double v);

  ListenerId addListener(Listener cb) { return listeners_.add(std::move(cb)); }
  bool removeListener(ListenerId id) { return listeners_.remove(id); }

private:
  void start(double target, double runMs, AnimationStatus direction, DoneCallback onDone);
  void onTick(double nowMs);
  void finish(bool completed);
  void detachTicker();
  DoneCallback takeDone();

  FrameScheduler& scheduler_;
  double durationMs_;
  double value_;
  double from_{0.0};
  double to_{0.0};
  double startMs_{0.0};
  double runMs_{0.0};
  AnimationStatus status_{AnimationStatus::Dismissed};
  bool animating_{false};
  TickerId ticker_{0};
  DoneCallback onDone_;
  ListenerList<> listeners_;
};

} // namespace rs
