#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace rs {

using ListenerId = std::uint64_t;

inline constexpr ListenerId kInvalidListener = 0;

// Ordered callback registry. notify() iterates a snapshot, so callbacks may
// add or remove listeners (including themselves) while being notified.
// Listeners removed mid-notify are not called afterwards.
template <typename... Args>
class ListenerList {
public:
  using Callback = std::function<void(Args...)>;

  ListenerId add(Callback cb) {
    ListenerId id = nextId_++;
    entries_.emplace_back(id, std::move(cb));
    return id;
  }

  bool remove(ListenerId id) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const Entry& e) { return e.first == id; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
  }

  bool contains(ListenerId id) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [id](const Entry& e) { return e.first == id; });
  }

  void notify(Args... args) const {
    std::vector<Entry> snapshot = entries_;
    for (auto& entry : snapshot) {
      if (!contains(entry.first)) continue;
      entry.second(args...);
    }
  }

  void clear() { entries_.clear(); }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

private:
  using Entry = std::pair<ListenerId, Callback>;
  ListenerId nextId_{1};
  std::vector<Entry> entries_;
};

} // namespace rs
