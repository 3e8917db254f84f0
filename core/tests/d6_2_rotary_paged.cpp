// D6.2: rotary input on a pager

#include "rs/rotary/RotaryEventSource.hpp"
#include "rs/rotary/RotaryInputController.hpp"
#include "rs/scroll/PageModel.hpp"
#include "rs/scroll/PositionTracker.hpp"
#include "rs/timing/FrameScheduler.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

// Forwards to a PageModel and records every requested page transition.
class RecordingPageSource : public rs::PageSource {
public:
  RecordingPageSource(rs::FrameScheduler& sched, int pages, int initialPage)
    : model_(sched, pages, 200.0, initialPage) {}

  double page() const override { return model_.page(); }
  int pageCount() const override { return model_.pageCount(); }
  double viewportExtent() const override { return model_.viewportExtent(); }

  void animateToPage(int page, const rs::MotionSpec& motion, rs::MoveDoneCallback onDone) override {
    requested.push_back(page);
    lastMotion = motion;
    model_.animateToPage(page, motion, std::move(onDone));
  }

  rs::ListenerId addListener(rs::ScrollListener cb) override { return model_.addListener(std::move(cb)); }
  void removeListener(rs::ListenerId id) override { model_.removeListener(id); }

  rs::PageModel& model() { return model_; }

  std::vector<int> requested;
  rs::MotionSpec lastMotion;

private:
  rs::PageModel model_;
};

struct CountingHaptics : rs::HapticActuator {
  int pulses{0};
  void vibrate(int, int) override { ++pulses; }
};

static const rs::RotaryEvent kCW{rs::RotaryDirection::Clockwise};
static const rs::RotaryEvent kCCW{rs::RotaryDirection::CounterClockwise};

int main() {
  // ---- Test 1: one tick turns one page ----
  {
    rs::FrameScheduler s;
    RecordingPageSource pages(s, 3, 0);
    rs::PagedPositionTracker tracker(pages);
    rs::QueuedRotaryEventSource rotary;
    CountingHaptics haptics;
    rs::RotaryInputController ctl(s, tracker, rotary, &haptics, rs::RotaryInputConfig{});

    rotary.push(kCW);
    rotary.dispatchPending();
    requireTrue(pages.requested.size() == 1 && pages.requested[0] == 1, "animateToPage(1)");
    requireTrue(pages.lastMotion.durationMs == 250.0, "page transition duration");
    requireTrue(pages.lastMotion.curve == rs::Curve::EaseInOutCirc, "page transition curve");
    requireTrue(ctl.positionEstimate() == 1.0 && haptics.pulses == 1, "estimate and pulse");
    s.advance(250.0);
    requireTrue(pages.page() == 1.0 && !ctl.isAnimating(), "landed on page 1");
    std::printf("  Test 1 (page turn): PASS\n");
  }

  // ---- Test 2: burst of page turns ----
  {
    rs::FrameScheduler s;
    RecordingPageSource pages(s, 5, 0);
    rs::PagedPositionTracker tracker(pages);
    rs::QueuedRotaryEventSource rotary;
    rs::RotaryInputController ctl(s, tracker, rotary, nullptr, rs::RotaryInputConfig{});

    rotary.push(kCW);
    rotary.push(kCW);
    rotary.dispatchPending();
    requireTrue(pages.requested.size() == 2 && pages.requested[1] == 2, "second tick targets page 2");
    s.advance(250.0);
    requireTrue(pages.page() == 2.0, "arrived on page 2");

    rotary.push(kCCW);
    rotary.dispatchPending();
    requireTrue(pages.requested.back() == 1, "counter-clockwise goes back");
    std::printf("  Test 2 (burst): PASS\n");
  }

  // ---- Test 3: last page edge bump ----
  {
    rs::FrameScheduler s;
    RecordingPageSource pages(s, 3, 2);
    rs::PagedPositionTracker tracker(pages);
    rs::QueuedRotaryEventSource rotary;
    CountingHaptics haptics;
    rs::RotaryInputController ctl(s, tracker, rotary, &haptics, rs::RotaryInputConfig{});
    int reveals = 0;
    ctl.setActivityCallback([&]() { ++reveals; });

    rotary.push(kCW);
    rotary.push(kCW);
    rotary.dispatchPending();
    requireTrue(pages.requested.size() == 1 && pages.requested[0] == 2, "bump re-targets the last page");
    requireTrue(haptics.pulses == 1 && reveals == 1, "bump pulses once");
    requireTrue(ctl.droppedTicks() == 1 && ctl.positionEstimate() == 2.0, "second tick dropped");

    s.advance(1000.0);
    rotary.push(kCW);
    rotary.dispatchPending();
    requireTrue(pages.requested.size() == 2 && haptics.pulses == 2, "bump again after cooldown");
    std::printf("  Test 3 (edge): PASS\n");
  }

  // ---- Test 4: idle resync truncates a fractional page ----
  {
    rs::FrameScheduler s;
    RecordingPageSource pages(s, 4, 0);
    rs::PagedPositionTracker tracker(pages);
    rs::QueuedRotaryEventSource rotary;
    rs::RotaryInputController ctl(s, tracker, rotary, nullptr, rs::RotaryInputConfig{});

    pages.model().jumpToPage(1.7);
    requireTrue(ctl.positionEstimate() == 1.0, "truncated to page 1");
    rotary.push(kCW);
    rotary.dispatchPending();
    requireTrue(pages.requested.back() == 2, "next page from truncated estimate");
    std::printf("  Test 4 (resync): PASS\n");
  }

  // ---- Test 5: scroll magnitude does not apply to pages ----
  {
    rs::FrameScheduler s;
    RecordingPageSource pages(s, 10, 0);
    rs::PagedPositionTracker tracker(pages);
    rs::QueuedRotaryEventSource rotary;
    rs::RotaryInputConfig cfg;
    cfg.scrollMagnitude = 500.0;
    cfg.pageMotion = rs::MotionSpec{400.0, rs::Curve::FastOutSlowIn};
    rs::RotaryInputController ctl(s, tracker, rotary, nullptr, cfg);

    rotary.push(kCW);
    rotary.dispatchPending();
    requireTrue(pages.requested.back() == 1, "one page per tick");
    requireTrue(pages.lastMotion.durationMs == 400.0, "configured page motion");
    std::printf("  Test 5 (page step): PASS\n");
  }

  std::printf("D6.2 rotary paged: ALL PASS\n");
  return 0;
}
