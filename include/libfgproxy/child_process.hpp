#pragma once

#include <sys/types.h>

#include <filesystem>
#include <functional>
#include <libfgproxy/event.hpp>
#include <libfgproxy/event_loop.hpp>
#include <libfgproxy/fd.hpp>
#include <libfgproxy/ipc.hpp>
#include <libfgproxy/stdio_policy.hpp>
#include <libfgproxy/stream.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fgproxy {
// How a child ended: exactly one of code and signal is set.
struct exit_status {
  exit_status() = default;
  // Decodes a waitpid status of a process that exited or was killed.
  explicit exit_status(int wait_status);

  static exit_status exited(int code);
  static exit_status signaled(int signo);

  std::optional<int> code;
  std::optional<int> signal;
};

// Standard process-creation settings.
struct launch_options {
  std::optional<std::filesystem::path> cwd;
  // Complete "KEY=VALUE" environment; absent inherits the parent's.
  std::optional<std::vector<std::string>> env;
  // argv[0] seen by the child; defaults to the program name.
  std::optional<std::string> argv0;
  // Absent means pipe for descriptors 0..2.
  std::optional<stdio_config> stdio;
  // Run the child in a new session.
  bool detached = false;
  std::optional<uid_t> uid;
  std::optional<gid_t> gid;
};

class child_process {
 public:
  using close_listener = std::function<void(exit_status const&)>;
  using message_listener = ipc_channel::message_listener;

  virtual ~child_process() = default;

  virtual pid_t pid() const = 0;
  // Null unless the descriptor is piped.
  virtual readable_stream* out() = 0;
  virtual readable_stream* err() = 0;
  virtual writable_stream* in() = 0;

  // Fired once, after the process ended and its piped output drained.
  virtual listener_id on_close(close_listener fn) = 0;
  virtual void remove_close_listener(listener_id id) = 0;

  virtual bool connected() const = 0;
  virtual bool send(ipc_message const& message) = 0;
  virtual listener_id on_message(message_listener fn) = 0;
  virtual void remove_message_listener(listener_id id) = 0;

  // Returns false if the child was already reaped.
  virtual bool kill(int signo) = 0;
};

// A child created with fork/exec and driven by an event_loop.
class posix_child : public child_process,
                    public std::enable_shared_from_this<posix_child> {
 public:
  // The program is looked up in PATH. Throws error when the program cannot
  // be executed; the failure is reported back before this returns.
  static std::shared_ptr<posix_child> launch(
      event_loop& loop, std::string const& file,
      std::vector<std::string> const& args, launch_options const& options = {});

  ~posix_child() override;

  posix_child(const posix_child&) = delete;
  posix_child& operator=(const posix_child&) = delete;

  pid_t pid() const override { return pid_; }
  readable_stream* out() override { return stdout_.get(); }
  readable_stream* err() override { return stderr_.get(); }
  writable_stream* in() override { return stdin_.get(); }

  listener_id on_close(close_listener fn) override;
  void remove_close_listener(listener_id id) override;

  bool connected() const override;
  bool send(ipc_message const& message) override;
  listener_id on_message(message_listener fn) override;
  void remove_message_listener(listener_id id) override;

  bool kill(int signo) override;

  std::optional<exit_status> status() const { return status_; }
  bool closed() const { return closed_; }

 private:
  posix_child(event_loop& loop, pid_t pid, file_descriptor pidfd);

  void reap();
  void maybe_close();

  event_loop* loop_;
  pid_t pid_;
  file_descriptor pidfd_;
  std::optional<event_loop::handle> pid_watch_;
  std::unique_ptr<fd_writable> stdin_;
  std::unique_ptr<fd_readable> stdout_;
  std::unique_ptr<fd_readable> stderr_;
  std::unique_ptr<ipc_channel> channel_;
  std::optional<exit_status> status_;
  bool closed_ = false;
  event<exit_status const&> close_;
};
}  // namespace fgproxy
