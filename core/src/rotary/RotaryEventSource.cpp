#include "rs/rotary/RotaryEventSource.hpp"
#include <cstdio>
#include <queue>

namespace rs {

QueuedRotaryEventSource::QueuedRotaryEventSource(std::size_t maxPending)
  : queue_(maxPending) {}

SubscriptionId QueuedRotaryEventSource::subscribe(Listener listener) {
  return subscribers_.add(std::move(listener));
}

void QueuedRotaryEventSource::unsubscribe(SubscriptionId id) {
  subscribers_.remove(id);
}

void QueuedRotaryEventSource::push(const RotaryEvent& event) {
  if (queue_.push(event)) return;
  dropped_.fetch_add(1);
  if (!overflowLogged_.exchange(true)) {
    std::fprintf(stderr, "QueuedRotaryEventSource: queue full (%zu), dropping oldest ticks\n",
                 queue_.capacity());
  }
}

std::size_t QueuedRotaryEventSource::dispatchPending() {
  std::queue<RotaryEvent> batch;
  queue_.drain(batch);
  overflowLogged_.store(false);

  std::size_t delivered = 0;
  while (!batch.empty()) {
    subscribers_.notify(batch.front());
    batch.pop();
    ++delivered;
  }
  return delivered;
}

} // namespace rs
