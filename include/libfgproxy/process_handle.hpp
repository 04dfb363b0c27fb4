#pragma once

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <libfgproxy/event.hpp>
#include <libfgproxy/event_loop.hpp>
#include <libfgproxy/ipc.hpp>
#include <libfgproxy/stream.hpp>
#include <memory>
#include <optional>

namespace fgproxy {
// The process a child is proxied through. current_process is the real one;
// anything else (tests, embedders) can stand in for it.
class process_handle {
 public:
  using signal_listener = std::function<void(int)>;
  using exit_listener = std::function<void(int)>;
  using message_listener = ipc_channel::message_listener;

  virtual ~process_handle() = default;

  virtual pid_t pid() const = 0;
  virtual writable_stream& out() = 0;
  virtual writable_stream& err() = 0;
  virtual readable_stream& in() = 0;

  virtual listener_id on_signal(int signo, signal_listener fn) = 0;
  virtual void remove_signal_listener(int signo, listener_id id) = 0;

  // Fired with the exit code while the process is exiting.
  virtual listener_id on_exit(exit_listener fn) = 0;
  virtual void remove_exit_listener(listener_id id) = 0;

  // Without an IPC channel can_send() is false, send() is a no-op and no
  // message is ever delivered.
  virtual bool can_send() const = 0;
  virtual void send(ipc_message const& message) = 0;
  virtual listener_id on_message(message_listener fn) = 0;
  virtual void remove_message_listener(listener_id id) = 0;
  virtual void remove_all_message_listeners() = 0;

  virtual void exit(int code) = 0;
  virtual void kill(pid_t pid, int signo) = 0;

  // Exit code used when the process ends without an explicit one.
  virtual std::optional<int> exit_code() const = 0;
  virtual void set_exit_code(int code) = 0;

  virtual bool is_current_process() const { return false; }
  // Keeps the process running for at least the given time.
  virtual void keep_alive(std::chrono::milliseconds) {}
};

class current_process : public process_handle {
 public:
  // Created on first use. Ignores SIGPIPE and picks up an IPC channel from
  // the environment.
  static current_process& instance();

  event_loop& loop() { return loop_; }

  pid_t pid() const override;
  writable_stream& out() override { return stdout_; }
  writable_stream& err() override { return stderr_; }
  readable_stream& in() override { return stdin_; }

  listener_id on_signal(int signo, signal_listener fn) override;
  void remove_signal_listener(int signo, listener_id id) override;

  listener_id on_exit(exit_listener fn) override;
  void remove_exit_listener(listener_id id) override;
  std::size_t exit_listener_count() const { return exit_.size(); }

  bool can_send() const override;
  void send(ipc_message const& message) override;
  listener_id on_message(message_listener fn) override;
  void remove_message_listener(listener_id id) override;
  void remove_all_message_listeners() override;

  [[noreturn]] void exit(int code) override;
  void kill(pid_t pid, int signo) override;

  std::optional<int> exit_code() const override { return exit_code_; }
  void set_exit_code(int code) override { exit_code_ = code; }

  bool is_current_process() const override { return true; }
  void keep_alive(std::chrono::milliseconds duration) override;

 private:
  current_process();
  static void run_exit_listeners();

  event_loop loop_;
  fd_writable stdout_;
  fd_writable stderr_;
  fd_readable stdin_;
  std::unique_ptr<ipc_channel> channel_;
  event<int> exit_;
  std::optional<int> exit_code_;
  bool exiting_ = false;
};
}  // namespace fgproxy
