#pragma once
#include "rs/config/ScrollbarConfig.hpp"
#include "rs/render/ArcPainter.hpp"
#include "rs/rotary/HapticActuator.hpp"
#include "rs/rotary/RotaryEventSource.hpp"
#include "rs/rotary/RotaryInputController.hpp"
#include "rs/scroll/PositionTracker.hpp"
#include "rs/scrollbar/ScrollbarFrame.hpp"
#include "rs/style/Theme.hpp"
#include "rs/timing/FrameScheduler.hpp"
#include "rs/visibility/VisibilityController.hpp"
#include <memory>

namespace rs {

// Circular auto-hiding scrollbar bound to one scroll or page source.
//
// The scheduler, source, rotary source and haptics are borrowed and must
// outlive the scrollbar. Destruction releases every subscription, timer and
// ticker it registered. Throws std::invalid_argument on an invalid config.
class RoundScrollbar {
public:
  RoundScrollbar(FrameScheduler& scheduler, ScrollSource& source,
                 const RoundScrollbarConfig& config = {},
                 RotaryEventSource* rotary = nullptr,
                 HapticActuator* haptics = nullptr);
  RoundScrollbar(FrameScheduler& scheduler, PageSource& source,
                 const RoundScrollbarConfig& config = {},
                 RotaryEventSource* rotary = nullptr,
                 HapticActuator* haptics = nullptr);
  ~RoundScrollbar();

  RoundScrollbar(const RoundScrollbar&) = delete;
  RoundScrollbar& operator=(const RoundScrollbar&) = delete;

  // Throws std::invalid_argument and keeps the old config on failure.
  void updateConfig(const RoundScrollbarConfig& config);
  const RoundScrollbarConfig& config() const { return config_; }

  void setTheme(const Theme& theme);
  const Theme& theme() const { return theme_; }

  ScrollbarFrame frame() const;

  // Paints only when the frame differs from the last painted one.
  bool paint(ArcPainter& painter);
  bool needsPaint() const;

  PositionTracker& tracker() { return *tracker_; }
  const PositionTracker& tracker() const { return *tracker_; }
  VisibilityController& visibility() { return visibility_; }
  const VisibilityController& visibility() const { return visibility_; }
  // Null when no rotary source was given.
  RotaryInputController* rotary() { return rotary_.get(); }

private:
  RoundScrollbar(FrameScheduler& scheduler, std::unique_ptr<PositionTracker> tracker,
                 const RoundScrollbarConfig& config, RotaryEventSource* rotary,
                 HapticActuator* haptics);

  void onTrackerChange(const ScrollChange& change);
  void updateThumb();
  void resolveColors();

  RoundScrollbarConfig config_;
  Theme theme_;
  ScrollbarColors colors_;
  std::unique_ptr<PositionTracker> tracker_;
  VisibilityController visibility_;
  std::unique_ptr<RotaryInputController> rotary_;
  ListenerId trackerSub_{0};

  ArcSegment thumb_;
  double lastViewportExtent_{0.0};

  bool painted_{false};
  ScrollbarFrame lastPainted_;
};

} // namespace rs
