#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace rs {

using TimerId = std::uint64_t;
using TickerId = std::uint64_t;

inline constexpr TimerId kInvalidTimer = 0;

// Single-threaded event-thread clock. Time only moves inside advance(), so
// hosts drive it from their frame loop and tests drive it deterministically.
//
// advance(dt) fires due timers in (dueTime, id) order. Tickers run with the
// clock set to each timer's due time just before that timer fires, and once
// more at the end of the step. Callbacks may schedule, cancel, add or remove
// tickers re-entrantly; a timer scheduled from a callback with zero delay
// fires within the same advance().
class FrameScheduler {
public:
  using TimerCallback = std::function<void()>;
  using TickerCallback = std::function<void(double nowMs)>;

  double nowMs() const { return nowMs_; }

  TimerId schedule(double delayMs, TimerCallback cb);
  bool cancel(TimerId id);
  bool isPending(TimerId id) const;
  std::size_t pendingTimers() const { return timers_.size(); }

  TickerId addTicker(TickerCallback cb);
  bool removeTicker(TickerId id);
  std::size_t tickerCount() const { return tickers_.size(); }

  void advance(double dtMs);

private:
  struct Timer {
    double dueMs{0.0};
    TimerCallback cb;
  };

  void runTickers();

  double nowMs_{0.0};
  TimerId nextTimerId_{1};
  TickerId nextTickerId_{1};
  std::map<TimerId, Timer> timers_;
  std::map<TickerId, TickerCallback> tickers_;
};

} // namespace rs
