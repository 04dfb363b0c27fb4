#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <cstdlib>
#include <libfgproxy/error.hpp>
#include <libfgproxy/process_handle.hpp>
#include <string>

namespace {
fgproxy::file_descriptor inherited_channel() {
  auto value = std::getenv(fgproxy::ipc_channel::fd_variable);
  if (value == nullptr) return {};

  std::string text = value;
  unsetenv(fgproxy::ipc_channel::fd_variable);

  int fd;
  try {
    std::size_t used = 0;
    fd = std::stoi(text, &used);
    if (used != text.size() or fd < 0) return {};
  } catch (std::logic_error const&) {
    return {};
  }

  auto flags = fcntl(fd, F_GETFD);
  if (flags < 0) return {};
  fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
  return fgproxy::file_descriptor(fd);
}
}  // namespace

fgproxy::current_process& fgproxy::current_process::instance() {
  // Never destroyed: exit listeners run from atexit and need it alive.
  static current_process* self = new current_process();
  return *self;
}

fgproxy::current_process::current_process()
    : stdout_(STDOUT_FILENO, false, &loop_),
      stderr_(STDERR_FILENO, false, &loop_),
      stdin_(loop_, STDIN_FILENO, false, false) {
  // Broken pipes surface as EPIPE on the write instead.
  ::signal(SIGPIPE, SIG_IGN);

  if (auto socket = inherited_channel()) {
    channel_ = std::make_unique<ipc_channel>(loop_, std::move(socket));
  }

  std::atexit(&current_process::run_exit_listeners);
}

void fgproxy::current_process::run_exit_listeners() {
  auto& self = instance();
  if (self.exiting_) return;
  self.exiting_ = true;
  self.exit_.emit(self.exit_code_.value_or(0));
}

pid_t fgproxy::current_process::pid() const { return getpid(); }

fgproxy::listener_id fgproxy::current_process::on_signal(int signo,
                                                         signal_listener fn) {
  return loop_.on_signal(signo, std::move(fn));
}

void fgproxy::current_process::remove_signal_listener(int signo,
                                                      listener_id id) {
  loop_.remove_signal_listener(signo, id);
}

fgproxy::listener_id fgproxy::current_process::on_exit(exit_listener fn) {
  return exit_.add(std::move(fn));
}

void fgproxy::current_process::remove_exit_listener(listener_id id) {
  exit_.remove(id);
}

bool fgproxy::current_process::can_send() const {
  return channel_ != nullptr and channel_->connected();
}

void fgproxy::current_process::send(ipc_message const& message) {
  if (channel_) {
    channel_->send(message);
  }
}

fgproxy::listener_id fgproxy::current_process::on_message(
    message_listener fn) {
  if (!channel_) return next_listener_id();
  return channel_->on_message(std::move(fn));
}

void fgproxy::current_process::remove_message_listener(listener_id id) {
  if (channel_) {
    channel_->remove_message_listener(id);
  }
}

void fgproxy::current_process::remove_all_message_listeners() {
  if (channel_) {
    channel_->remove_all_message_listeners();
  }
}

void fgproxy::current_process::exit(int code) {
  exit_code_ = code;
  std::exit(code);
}

void fgproxy::current_process::kill(pid_t pid, int signo) {
  if (::kill(pid, signo) < 0) {
    error::send_errno("could not send " + std::to_string(signo) +
                      " to process " + std::to_string(pid));
  }
}

void fgproxy::current_process::keep_alive(std::chrono::milliseconds duration) {
  loop_.add_timer(duration, [] {});
}
