#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace fgproxy {
using listener_id = std::uint64_t;

// Ids are unique across every event in the process, so a stale id can never
// remove somebody else's listener.
inline listener_id next_listener_id() {
  static listener_id next = 0;
  return ++next;
}

template <typename... Args>
class event {
 public:
  using listener = std::function<void(Args...)>;

  listener_id add(listener fn) {
    auto id = next_listener_id();
    listeners_.emplace_back(id, std::move(fn));
    return id;
  }

  bool remove(listener_id id) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](auto const& entry) { return entry.first == id; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
  }

  bool contains(listener_id id) const {
    return std::any_of(listeners_.begin(), listeners_.end(),
                       [id](auto const& entry) { return entry.first == id; });
  }

  void clear() { listeners_.clear(); }
  std::size_t size() const { return listeners_.size(); }
  bool empty() const { return listeners_.empty(); }

  // Listeners may add or remove listeners while being called. One removed
  // during dispatch is not called afterwards; one added is not called until
  // the next emit.
  void emit(Args... args) const {
    auto snapshot = listeners_;
    for (auto& [id, fn] : snapshot) {
      if (contains(id)) fn(args...);
    }
  }

 private:
  std::vector<std::pair<listener_id, listener>> listeners_;
};
}  // namespace fgproxy
