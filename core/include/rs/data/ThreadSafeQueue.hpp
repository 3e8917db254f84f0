#pragma once
#include <cstddef>
#include <mutex>
#include <queue>

namespace rs {

// Bounded MPSC hand-off between an input thread and the event thread.
// At capacity the oldest item is discarded.
template <typename T>
class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(std::size_t maxCapacity = 256)
      : maxCap_(maxCapacity == 0 ? 1 : maxCapacity) {}

  // Returns false when an older item had to be dropped to make room.
  bool push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    bool dropped = false;
    if (queue_.size() >= maxCap_) {
      queue_.pop();
      dropped = true;
    }
    queue_.push(std::move(item));
    return !dropped;
  }

  // Moves everything currently queued into `out` under a single lock.
  std::size_t drain(std::queue<T>& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = queue_.size();
    while (!queue_.empty()) {
      out.push(std::move(queue_.front()));
      queue_.pop();
    }
    return n;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  std::size_t capacity() const { return maxCap_; }

private:
  mutable std::mutex mtx_;
  std::queue<T> queue_;
  std::size_t maxCap_;
};

} // namespace rs
