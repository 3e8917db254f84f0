#include "rs/timing/FrameScheduler.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace rs {

TimerId FrameScheduler::schedule(double delayMs, TimerCallback cb) {
  if (!cb) return kInvalidTimer;
  double delay = std::isfinite(delayMs) ? std::max(0.0, delayMs) : 0.0;
  TimerId id = nextTimerId_++;
  timers_[id] = Timer{nowMs_ + delay, std::move(cb)};
  return id;
}

bool FrameScheduler::cancel(TimerId id) {
  return timers_.erase(id) > 0;
}

bool FrameScheduler::isPending(TimerId id) const {
  return timers_.find(id) != timers_.end();
}

TickerId FrameScheduler::addTicker(TickerCallback cb) {
  if (!cb) return 0;
  TickerId id = nextTickerId_++;
  tickers_[id] = std::move(cb);
  return id;
}

bool FrameScheduler::removeTicker(TickerId id) {
  return tickers_.erase(id) > 0;
}

void FrameScheduler::runTickers() {
  std::vector<TickerId> ids;
  ids.reserve(tickers_.size());
  for (const auto& kv : tickers_) ids.push_back(kv.first);

  for (TickerId id : ids) {
    auto it = tickers_.find(id);
    if (it == tickers_.end()) continue;
    // Copy: the ticker may remove itself while running.
    TickerCallback cb = it->second;
    cb(nowMs_);
  }
}

void FrameScheduler::advance(double dtMs) {
  double dt = std::isfinite(dtMs) ? std::max(0.0, dtMs) : 0.0;
  double target = nowMs_ + dt;

  for (;;) {
    auto next = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (it->second.dueMs > target) continue;
      if (next == timers_.end() || it->second.dueMs < next->second.dueMs) {
        next = it;
      }
    }
    if (next == timers_.end()) break;

    TimerId dueId = next->first;
    nowMs_ = std::max(nowMs_, next->second.dueMs);
    runTickers();

    // The tickers may have cancelled it.
    auto it = timers_.find(dueId);
    if (it == timers_.end()) continue;
    TimerCallback cb = std::move(it->second.cb);
    timers_.erase(it);
    cb();
  }

  nowMs_ = target;
  runTickers();
}

} // namespace rs
