#pragma once
#include "rs/data/ThreadSafeQueue.hpp"
#include "rs/events/ListenerList.hpp"
#include "rs/rotary/RotaryEvent.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace rs {

using SubscriptionId = ListenerId;

// Subscribers are invoked on the event thread, one tick at a time.
class RotaryEventSource {
public:
  using Listener = std::function<void(const RotaryEvent&)>;

  virtual ~RotaryEventSource() = default;

  virtual SubscriptionId subscribe(Listener listener) = 0;
  virtual void unsubscribe(SubscriptionId id) = 0;
};

// Device threads push(); the event thread calls dispatchPending() from its
// frame loop. Ticks beyond maxPending drop the oldest.
class QueuedRotaryEventSource : public RotaryEventSource {
public:
  explicit QueuedRotaryEventSource(std::size_t maxPending = 64);

  SubscriptionId subscribe(Listener listener) override;
  void unsubscribe(SubscriptionId id) override;

  // Thread-safe.
  void push(const RotaryEvent& event);

  // Event thread only. Returns the number of ticks delivered.
  std::size_t dispatchPending();

  std::size_t pending() const { return queue_.size(); }
  std::size_t subscriberCount() const { return subscribers_.size(); }
  std::uint64_t droppedCount() const { return dropped_.load(); }

private:
  ThreadSafeQueue<RotaryEvent> queue_;
  ListenerList<const RotaryEvent&> subscribers_;
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<bool> overflowLogged_{false};
};

} // namespace rs
