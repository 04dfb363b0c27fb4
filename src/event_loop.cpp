#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <array>
#include <libfgproxy/error.hpp>
#include <libfgproxy/event_loop.hpp>
#include <vector>

namespace {
// epoll data for the loop's own signalfd; watch handles start at 1.
constexpr fgproxy::event_loop::handle signal_handle = 0;
}  // namespace

fgproxy::event_loop::event_loop() {
  epoll_.reset(epoll_create1(EPOLL_CLOEXEC));
  if (!epoll_) {
    error::send_errno("could not create epoll instance");
  }

  sigemptyset(&signal_mask_);
  signal_fd_.reset(signalfd(-1, &signal_mask_, SFD_NONBLOCK | SFD_CLOEXEC));
  if (!signal_fd_) {
    error::send_errno("could not create signalfd");
  }

  epoll_event ev{};
  ev.events = EPOLLIN;
  ev.data.u64 = signal_handle;
  if (epoll_ctl(epoll_.get(), EPOLL_CTL_ADD, signal_fd_.get(), &ev) < 0) {
    error::send_errno("could not watch signalfd");
  }
}

fgproxy::event_loop::~event_loop() {
  // Give every signal we were holding back its default delivery.
  if (!sigisemptyset(&signal_mask_)) {
    sigprocmask(SIG_UNBLOCK, &signal_mask_, nullptr);
  }
}

fgproxy::event_loop::handle fgproxy::event_loop::watch(int fd,
                                                       callback on_ready) {
  auto id = watch_if_pollable(fd, std::move(on_ready));
  if (!id) {
    error::send_errno("could not watch descriptor");
  }
  return *id;
}

std::optional<fgproxy::event_loop::handle>
fgproxy::event_loop::watch_if_pollable(int fd, callback on_ready) {
  return add_watch(fd, EPOLLIN, std::move(on_ready));
}

fgproxy::event_loop::handle fgproxy::event_loop::watch_writable(
    int fd, callback on_ready) {
  auto id = add_watch(fd, EPOLLOUT, std::move(on_ready));
  if (!id) {
    error::send_errno("could not watch descriptor for output");
  }
  return *id;
}

std::optional<fgproxy::event_loop::handle> fgproxy::event_loop::add_watch(
    int fd, std::uint32_t events, callback on_ready) {
  auto id = next_handle_ + 1;
  epoll_event ev{};
  ev.events = events;
  ev.data.u64 = id;
  if (epoll_ctl(epoll_.get(), EPOLL_CTL_ADD, fd, &ev) < 0) {
    if (errno == EPERM) return std::nullopt;
    error::send_errno("could not watch descriptor");
  }
  next_handle_ = id;
  watches_.emplace(id, std::make_pair(fd, std::move(on_ready)));
  return id;
}

void fgproxy::event_loop::unwatch(handle id) {
  auto it = watches_.find(id);
  if (it == watches_.end()) return;
  // The descriptor may already be closed, in which case epoll dropped it.
  if (epoll_ctl(epoll_.get(), EPOLL_CTL_DEL, it->second.first, nullptr) < 0 and
      errno != EBADF and errno != ENOENT) {
    error::send_errno("could not unwatch descriptor");
  }
  watches_.erase(it);
}

fgproxy::event_loop::handle fgproxy::event_loop::add_timer(
    std::chrono::milliseconds delay, callback on_expire) {
  file_descriptor fd(timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC));
  if (!fd) {
    error::send_errno("could not create timer");
  }

  itimerspec spec{};
  auto count = delay.count() > 0 ? delay.count() : 1;
  spec.it_value.tv_sec = count / 1000;
  spec.it_value.tv_nsec = (count % 1000) * 1000000;
  if (timerfd_settime(fd.get(), 0, &spec, nullptr) < 0) {
    error::send_errno("could not arm timer");
  }

  auto id = ++next_handle_;
  auto raw = fd.get();
  auto watch_id = watch(raw, [this, id, on_expire = std::move(on_expire)] {
    cancel_timer(id);
    on_expire();
  });
  timers_.emplace(id, timer{std::move(fd), watch_id});
  return id;
}

void fgproxy::event_loop::cancel_timer(handle id) {
  auto it = timers_.find(id);
  if (it == timers_.end()) return;
  unwatch(it->second.watch);
  timers_.erase(it);
}

fgproxy::listener_id fgproxy::event_loop::on_signal(int signo,
                                                    signal_callback fn) {
  auto& listeners = signals_[signo];
  auto id = listeners.add(std::move(fn));
  if (listeners.size() == 1) {
    sigaddset(&signal_mask_, signo);
    update_signal_mask();

    sigset_t one;
    sigemptyset(&one);
    sigaddset(&one, signo);
    if (sigprocmask(SIG_BLOCK, &one, nullptr) < 0) {
      error::send_errno("could not block signal");
    }
  }
  return id;
}

void fgproxy::event_loop::remove_signal_listener(int signo, listener_id id) {
  auto it = signals_.find(signo);
  if (it == signals_.end() or !it->second.remove(id)) return;
  if (!it->second.empty()) return;

  sigdelset(&signal_mask_, signo);
  update_signal_mask();

  sigset_t one;
  sigemptyset(&one);
  sigaddset(&one, signo);
  // A signal that arrived while it was still subscribed belongs to the old
  // listeners; unblocking must not hand it to the default action.
  timespec immediately{};
  while (sigtimedwait(&one, nullptr, &immediately) >= 0 or errno == EINTR) {
  }
  if (errno != EAGAIN) {
    error::send_errno("could not discard pending signal");
  }
  if (sigprocmask(SIG_UNBLOCK, &one, nullptr) < 0) {
    error::send_errno("could not unblock signal");
  }
}

std::size_t fgproxy::event_loop::signal_listener_count(int signo) const {
  auto it = signals_.find(signo);
  return it == signals_.end() ? 0 : it->second.size();
}

void fgproxy::event_loop::update_signal_mask() {
  if (signalfd(signal_fd_.get(), &signal_mask_, 0) < 0) {
    error::send_errno("could not update signalfd mask");
  }
}

void fgproxy::event_loop::dispatch_signals() {
  signalfd_siginfo info;
  while (true) {
    auto got = ::read(signal_fd_.get(), &info, sizeof(info));
    if (got < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN) break;
      error::send_errno("could not read signalfd");
    }
    if (got != sizeof(info)) break;

    auto signo = static_cast<int>(info.ssi_signo);
    // Entries are never erased, so the event outlives its own dispatch even
    // when a listener drops the last subscription.
    auto it = signals_.find(signo);
    if (it == signals_.end()) continue;
    it->second.emit(signo);
  }
}

bool fgproxy::event_loop::run_once(int timeout_ms) {
  std::array<epoll_event, 16> events;
  int ready;
  while ((ready = epoll_wait(epoll_.get(), events.data(), events.size(),
                             timeout_ms)) < 0) {
    if (errno != EINTR) {
      error::send_errno("epoll_wait failed");
    }
  }

  for (int i = 0; i < ready; ++i) {
    auto id = events[i].data.u64;
    if (id == signal_handle) {
      dispatch_signals();
      continue;
    }
    // An earlier callback in this batch may have removed this watch.
    auto it = watches_.find(id);
    if (it == watches_.end()) continue;
    auto on_ready = it->second.second;
    on_ready();
  }
  return ready > 0;
}

void fgproxy::event_loop::run() {
  while (alive()) {
    run_once();
  }
}
