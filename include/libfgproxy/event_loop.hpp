#pragma once

#include <signal.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <libfgproxy/event.hpp>
#include <libfgproxy/fd.hpp>
#include <map>
#include <optional>

namespace fgproxy {
// Single-threaded epoll loop. Descriptor watches and timers keep the loop
// alive; signal listeners do not.
class event_loop {
 public:
  using handle = std::uint64_t;
  using callback = std::function<void()>;
  using signal_callback = std::function<void(int)>;

  event_loop();
  ~event_loop();

  event_loop(const event_loop&) = delete;
  event_loop& operator=(const event_loop&) = delete;

  // Calls on_ready whenever fd is readable or hung up. The loop does not own
  // fd; unwatch it before closing it.
  handle watch(int fd, callback on_ready);
  // Same as watch, but returns nothing for descriptors epoll refuses
  // (regular files, /dev/null).
  std::optional<handle> watch_if_pollable(int fd, callback on_ready);
  // Calls on_ready whenever fd can take more data or its reader went away.
  handle watch_writable(int fd, callback on_ready);
  void unwatch(handle id);

  handle add_timer(std::chrono::milliseconds delay, callback on_expire);
  void cancel_timer(handle id);

  // While a signal has listeners it is blocked and read from a signalfd.
  listener_id on_signal(int signo, signal_callback fn);
  void remove_signal_listener(int signo, listener_id id);
  std::size_t signal_listener_count(int signo) const;

  bool alive() const { return !watches_.empty() or !timers_.empty(); }

  // Dispatches one batch of ready events. Returns false if nothing was
  // dispatched before the timeout.
  bool run_once(int timeout_ms = -1);
  void run();

  // Pumps the loop until the future is ready. Once the loop has nothing left
  // to dispatch, blocks on the future alone (another thread may settle it).
  template <typename T>
  T wait(std::future<T>& pending) {
    using namespace std::chrono_literals;
    while (pending.wait_for(0s) != std::future_status::ready) {
      if (alive() or !sigisemptyset(&signal_mask_)) {
        run_once(wait_tick_ms);
      } else {
        pending.wait();
      }
    }
    return pending.get();
  }

 private:
  static constexpr int wait_tick_ms = 50;

  struct timer {
    file_descriptor fd;
    handle watch;
  };

  std::optional<handle> add_watch(int fd, std::uint32_t events,
                                  callback on_ready);
  void update_signal_mask();
  void dispatch_signals();

  file_descriptor epoll_;
  file_descriptor signal_fd_;
  sigset_t signal_mask_;
  handle next_handle_ = 0;
  std::map<handle, std::pair<int, callback>> watches_;
  std::map<handle, timer> timers_;
  std::map<int, event<int>> signals_;
};
}  // namespace fgproxy
