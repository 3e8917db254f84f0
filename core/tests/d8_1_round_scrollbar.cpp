// D8.1: RoundScrollbar wiring (thumb, visibility, paint gating, rotary, teardown)

#include "rs/rotary/RotaryEventSource.hpp"
#include "rs/scroll/PageModel.hpp"
#include "rs/scroll/ScrollModel.hpp"
#include "rs/scrollbar/RoundScrollbar.hpp"
#include "rs/timing/FrameScheduler.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool near(float a, float b, float eps = 1e-5f) { return std::fabs(a - b) <= eps; }

struct RecordingPainter : rs::ArcPainter {
  int paints{0};
  rs::ScrollbarFrame last;
  void paint(const rs::ScrollbarFrame& frame) override {
    ++paints;
    last = frame;
  }
};

struct CountingHaptics : rs::HapticActuator {
  int pulses{0};
  void vibrate(int, int) override { ++pulses; }
};

int main() {
  // ---- Test 1: first layout reveals the scrollbar ----
  {
    rs::FrameScheduler s;
    rs::ScrollModel list(s, 100.0, 400.0);
    rs::RoundScrollbar bar(s, list);
    requireTrue(bar.visibility().state() == rs::VisibilityState::Appearing, "appears on layout");
    s.advance(250.0);
    rs::ScrollbarFrame f = bar.frame();
    requireTrue(f.opacity == 1.0f, "fully visible");
    requireTrue(near(f.track.startAngle, rs::kTrackStartAngle) && near(f.track.length, rs::kTrackLength),
                "track arc");
    requireTrue(near(f.thumb.length, rs::kTrackLength * 0.2f), "thumb is a fifth of the track");
    requireTrue(near(f.track.colorAlphaScale, 0.60f) && f.thumb.colorAlphaScale == 1.0f,
                "alpha scales from dark theme colors");
    requireTrue(f.padding == 8.0f && f.strokeWidth == 8.0f, "layout defaults");
    std::printf("  Test 1 (initial): PASS\n");
  }

  // ---- Test 2: paint only when something changed ----
  {
    rs::FrameScheduler s;
    rs::ScrollModel list(s, 100.0, 400.0);
    rs::RoundScrollbar bar(s, list);
    RecordingPainter painter;
    requireTrue(bar.needsPaint() && bar.paint(painter), "first paint");
    s.advance(250.0);
    requireTrue(bar.paint(painter), "opacity changed");
    requireTrue(!bar.needsPaint() && !bar.paint(painter), "steady frame skipped");
    list.jumpTo(200.0);
    requireTrue(bar.paint(painter), "thumb moved");
    requireTrue(near(painter.last.thumb.startAngle,
                     rs::kTrackStartAngle + 2.0f * painter.last.thumb.length),
                "thumb at index 2");
    requireTrue(painter.paints == 3, "three paints");
    std::printf("  Test 2 (paint gating): PASS\n");
  }

  // ---- Test 3: scrolling reveals a hidden scrollbar ----
  {
    rs::FrameScheduler s;
    rs::ScrollModel list(s, 100.0, 400.0);
    rs::RoundScrollbar bar(s, list);
    s.advance(3250.0);
    requireTrue(bar.visibility().state() == rs::VisibilityState::Hidden, "auto-hidden");
    requireTrue(bar.frame().opacity == 0.0f, "transparent");
    list.jumpTo(100.0);
    requireTrue(bar.visibility().state() == rs::VisibilityState::Appearing, "revealed by scroll");

    // Content growth alone is not activity.
    s.advance(3250.0);
    list.setMetrics(100.0, 900.0);
    requireTrue(bar.visibility().state() == rs::VisibilityState::Hidden, "content change ignored");
    requireTrue(near(bar.frame().thumb.length, rs::kTrackLength * 0.1f), "thumb still tracks content");

    // A viewport change is.
    list.setMetrics(200.0, 900.0);
    requireTrue(bar.visibility().state() == rs::VisibilityState::Appearing, "viewport change reveals");
    std::printf("  Test 3 (activity): PASS\n");
  }

  // ---- Test 4: non-scrollable content stays hidden ----
  {
    rs::FrameScheduler s;
    rs::ScrollModel list(s, 100.0, 0.0);
    rs::RoundScrollbar bar(s, list);
    requireTrue(bar.visibility().state() == rs::VisibilityState::Hidden, "nothing to scroll");
    s.advance(500.0);
    requireTrue(bar.frame().opacity == 0.0f, "still transparent");
    list.setMetrics(100.0, 300.0);
    requireTrue(bar.visibility().state() == rs::VisibilityState::Appearing, "became scrollable");
    s.advance(250.0);
    list.setMetrics(100.0, 0.0);
    requireTrue(bar.visibility().state() == rs::VisibilityState::Disappearing, "lost scrollability");
    std::printf("  Test 4 (scrollability): PASS\n");
  }

  // ---- Test 5: paged source ----
  {
    rs::FrameScheduler s;
    rs::PageModel pages(s, 3, 200.0, 1);
    rs::RoundScrollbar bar(s, pages);
    requireTrue(bar.tracker().model() == rs::PositionModel::Paged, "paged tracker");
    rs::ScrollbarFrame f = bar.frame();
    requireTrue(near(f.thumb.length, rs::kTrackLength / 3.0f), "a third of the track");
    requireTrue(near(f.thumb.startAngle, rs::kTrackStartAngle + f.thumb.length), "on page 1");
    std::printf("  Test 5 (paged): PASS\n");
  }

  // ---- Test 6: rotary input and edge reveal ----
  {
    rs::FrameScheduler s;
    rs::ScrollModel list(s, 100.0, 400.0, 400.0);
    rs::QueuedRotaryEventSource rotary;
    CountingHaptics haptics;
    rs::RoundScrollbar bar(s, list, rs::RoundScrollbarConfig{}, &rotary, &haptics);
    requireTrue(bar.rotary() != nullptr, "rotary attached");
    s.advance(3250.0);
    requireTrue(bar.visibility().state() == rs::VisibilityState::Hidden, "hidden at the end");

    rotary.push(rs::RotaryEvent{rs::RotaryDirection::Clockwise});
    rotary.dispatchPending();
    requireTrue(haptics.pulses == 1, "edge bump pulsed");
    requireTrue(bar.visibility().state() == rs::VisibilityState::Appearing, "edge bump reveals");

    rotary.push(rs::RotaryEvent{rs::RotaryDirection::CounterClockwise});
    rotary.dispatchPending();
    s.advance(100.0);
    requireTrue(list.offset() == 350.0, "rotary scrolled back one step");

    rs::FrameScheduler s2;
    rs::ScrollModel plain(s2, 100.0, 400.0);
    rs::RoundScrollbar noRotary(s2, plain);
    requireTrue(noRotary.rotary() == nullptr, "no rotary without a source");
    std::printf("  Test 6 (rotary): PASS\n");
  }

  // ---- Test 7: config and theme ----
  {
    rs::FrameScheduler s;
    rs::ScrollModel list(s, 100.0, 400.0);

    rs::RoundScrollbarConfig bad;
    bad.strokeWidth = -2.0f;
    bool threw = false;
    try {
      rs::RoundScrollbar broken(s, list, bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "invalid config rejected");
    requireTrue(list.listenerCount() == 0, "failed construction left no listener");

    rs::RoundScrollbar bar(s, list);
    rs::RoundScrollbarConfig cfg;
    cfg.padding = 4.0f;
    cfg.hasThumbColor = true;
    cfg.thumbColor[0] = 1.0f;
    cfg.thumbColor[3] = 0.5f;
    bar.updateConfig(cfg);
    rs::ScrollbarFrame f = bar.frame();
    requireTrue(f.padding == 4.0f && f.thumbColor[0] == 1.0f, "config applied");
    requireTrue(f.thumb.colorAlphaScale == 0.5f, "override alpha scales the thumb");

    threw = false;
    try {
      bar.updateConfig(bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw && bar.config().padding == 4.0f, "old config kept");

    bar.setTheme(rs::lightTheme());
    f = bar.frame();
    requireTrue(f.thumbColor[0] == 1.0f, "override beats theme");
    requireTrue(near(f.trackColor[0], 0.74f), "track from light highlight");
    std::printf("  Test 7 (config/theme): PASS\n");
  }

  // ---- Test 8: teardown releases everything ----
  {
    rs::FrameScheduler s;
    rs::ScrollModel list(s, 100.0, 400.0);
    rs::QueuedRotaryEventSource rotary;
    {
      rs::RoundScrollbar bar(s, list, rs::RoundScrollbarConfig{}, &rotary, nullptr);
      requireTrue(s.pendingTimers() == 1 && s.tickerCount() == 1, "hide timer and fade ticker");
      rotary.push(rs::RotaryEvent{rs::RotaryDirection::Clockwise});
      rotary.dispatchPending();
    }
    requireTrue(list.listenerCount() == 0, "source listener removed");
    requireTrue(rotary.subscriberCount() == 0, "rotary unsubscribed");
    requireTrue(s.pendingTimers() == 0, "timers cancelled");
    s.advance(500.0);
    requireTrue(list.offset() == 50.0, "in-flight scroll finished without the scrollbar");
    requireTrue(s.tickerCount() == 0, "no tickers left");
    std::printf("  Test 8 (teardown): PASS\n");
  }

  std::printf("D8.1 round scrollbar: ALL PASS\n");
  return 0;
}
