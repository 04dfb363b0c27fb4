#include <fcntl.h>
#include <grp.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <libfgproxy/child_process.hpp>
#include <libfgproxy/error.hpp>
#include <libfgproxy/pipe.hpp>

extern char** environ;

namespace {
// The descriptor the child sees at a slot, and the parent's end of it.
struct slot {
  fgproxy::stdio_mode mode;
  int child_fd = -1;
  fgproxy::file_descriptor parent_end;
  fgproxy::file_descriptor child_end;
};

// Forked child only: nobody is left to report a failed report to.
[[noreturn]] void exit_with_perror(fgproxy::pipe& channel,
                                   std::string const& prefix) {
  auto message = prefix + ": " + std::strerror(errno);
  if (::write(channel.get_write(), message.data(), message.size()) < 0) {
    _exit(126);
  }
  _exit(127);
}

std::vector<slot> prepare_slots(std::vector<fgproxy::stdio_mode> const& modes) {
  using fgproxy::stdio_mode;

  auto ipc_count = std::count(modes.begin(), modes.end(), stdio_mode::ipc);
  if (ipc_count > 1) {
    fgproxy::error::send("stdio may contain only one ipc channel");
  }

  std::vector<slot> slots;
  for (std::size_t i = 0; i < modes.size(); ++i) {
    slot s;
    s.mode = modes[i];
    switch (modes[i]) {
      case stdio_mode::pipe: {
        if (i > 2) {
          fgproxy::error::send("only descriptors 0 to 2 can be piped");
        }
        fgproxy::pipe p(true);
        if (i == 0) {
          s.child_end.reset(p.release_read());
          s.parent_end.reset(p.release_write());
          // A child that stops reading must not stall the loop.
          auto flags = fcntl(s.parent_end.get(), F_GETFL);
          if (flags < 0 or
              fcntl(s.parent_end.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
            fgproxy::error::send_errno("could not make child stdin non-blocking");
          }
        } else {
          s.parent_end.reset(p.release_read());
          s.child_end.reset(p.release_write());
        }
        s.child_fd = s.child_end.get();
        break;
      }
      case stdio_mode::ignore: {
        s.child_end.reset(open("/dev/null", O_RDWR | O_CLOEXEC));
        if (!s.child_end) {
          fgproxy::error::send_errno("could not open /dev/null");
        }
        s.child_fd = s.child_end.get();
        break;
      }
      case stdio_mode::ipc: {
        if (i < 3) {
          fgproxy::error::send("the ipc channel cannot replace descriptor " +
                               std::to_string(i));
        }
        auto [parent_end, child_end] = fgproxy::ipc_channel::socket_pair();
        s.parent_end = std::move(parent_end);
        s.child_end = std::move(child_end);
        s.child_fd = s.child_end.get();
        break;
      }
      case stdio_mode::inherit: {
        // Only pass descriptors the parent actually has open.
        if (fcntl(static_cast<int>(i), F_GETFD) != -1) {
          s.child_fd = static_cast<int>(i);
        }
        break;
      }
    }
    slots.push_back(std::move(s));
  }
  return slots;
}

std::vector<std::string> child_environment(
    fgproxy::launch_options const& options, std::optional<std::size_t> ipc_slot) {
  std::vector<std::string> env;
  if (options.env) {
    env = *options.env;
  } else {
    for (auto entry = environ; *entry != nullptr; ++entry) {
      env.emplace_back(*entry);
    }
  }

  std::string const prefix = std::string(fgproxy::ipc_channel::fd_variable) + "=";
  env.erase(std::remove_if(env.begin(), env.end(),
                           [&](std::string const& entry) {
                             return entry.compare(0, prefix.size(), prefix) == 0;
                           }),
            env.end());
  if (ipc_slot) {
    env.push_back(prefix + std::to_string(*ipc_slot));
  }
  return env;
}

std::vector<char*> c_strings(std::vector<std::string>& strings) {
  std::vector<char*> out;
  for (auto& str : strings) {
    out.push_back(str.data());
  }
  out.push_back(nullptr);
  return out;
}

// Runs in the forked child; only returns by exec'ing or exiting.
[[noreturn]] void exec_child(fgproxy::pipe& channel, std::vector<slot>& slots,
                             fgproxy::launch_options const& options,
                             std::string const& file, char* const* argv,
                             char* const* envp) {
  channel.close_read();

  sigset_t none;
  sigemptyset(&none);
  sigprocmask(SIG_SETMASK, &none, nullptr);
  for (int signo = 1; signo < NSIG; ++signo) {
    if (signo != SIGKILL and signo != SIGSTOP) {
      ::signal(signo, SIG_DFL);
    }
  }

  if (options.detached and setsid() < 0) {
    exit_with_perror(channel, "could not create session");
  }

  // Lift every source descriptor above the slot range so the dup2 calls
  // below cannot clobber one another. The error channel already is.
  auto floor = static_cast<int>(slots.size());
  auto lift = [&](int fd) {
    if (fd < 0 or fd >= floor) return fd;
    auto moved = fcntl(fd, F_DUPFD_CLOEXEC, floor);
    if (moved < 0) {
      exit_with_perror(channel, "could not move descriptor");
    }
    return moved;
  };
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (slots[i].mode != fgproxy::stdio_mode::inherit) {
      slots[i].child_fd = lift(slots[i].child_fd);
    }
  }

  for (std::size_t i = 0; i < slots.size(); ++i) {
    auto target = static_cast<int>(i);
    auto source = slots[i].child_fd;
    if (source == -1) {
      close(target);
    } else if (source == target) {
      auto flags = fcntl(target, F_GETFD);
      if (flags >= 0) {
        fcntl(target, F_SETFD, flags & ~FD_CLOEXEC);
      }
    } else if (dup2(source, target) < 0) {
      exit_with_perror(channel, "could not set up descriptor " +
                                    std::to_string(target));
    }
  }

  if (options.gid) {
    if (setgroups(0, nullptr) < 0 and errno != EPERM) {
      exit_with_perror(channel, "could not drop supplementary groups");
    }
    if (setgid(*options.gid) < 0) {
      exit_with_perror(channel, "could not change group");
    }
  }
  if (options.uid and setuid(*options.uid) < 0) {
    exit_with_perror(channel, "could not change user");
  }
  if (options.cwd and chdir(options.cwd->c_str()) < 0) {
    exit_with_perror(channel, "could not change directory to " +
                                  options.cwd->string());
  }

  execvpe(file.c_str(), argv, envp);
  exit_with_perror(channel, "could not execute " + file);
}
}  // namespace

fgproxy::exit_status::exit_status(int wait_status) {
  if (WIFEXITED(wait_status)) {
    code = WEXITSTATUS(wait_status);
  } else if (WIFSIGNALED(wait_status)) {
    signal = WTERMSIG(wait_status);
  }
}

fgproxy::exit_status fgproxy::exit_status::exited(int code) {
  exit_status status;
  status.code = code;
  return status;
}

fgproxy::exit_status fgproxy::exit_status::signaled(int signo) {
  exit_status status;
  status.signal = signo;
  return status;
}

std::shared_ptr<fgproxy::posix_child> fgproxy::posix_child::launch(
    event_loop& loop, std::string const& file,
    std::vector<std::string> const& args, launch_options const& options) {
  auto modes = expand_stdio(options.stdio.value_or(stdio_mode::pipe));
  auto slots = prepare_slots(modes);

  std::optional<std::size_t> ipc_slot;
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (slots[i].mode == stdio_mode::ipc) ipc_slot = i;
  }

  std::vector<std::string> argv_strings;
  argv_strings.push_back(options.argv0.value_or(file));
  argv_strings.insert(argv_strings.end(), args.begin(), args.end());
  auto env_strings = child_environment(options, ipc_slot);
  auto argv = c_strings(argv_strings);
  auto envp = c_strings(env_strings);

  pipe channel(true);
  channel.lift(static_cast<int>(slots.size()));
  pid_t pid = fork();
  if (pid < 0) {
    error::send_errno("fork failed");
  }
  if (pid == 0) {
    exec_child(channel, slots, options, file, argv.data(), envp.data());
  }

  channel.close_write();
  for (auto& s : slots) {
    s.child_end.reset();
  }
  auto data = channel.read();
  channel.close_read();

  if (data.size() > 0) {
    waitpid(pid, nullptr, 0);
    auto chars = reinterpret_cast<char*>(data.data());
    error::send(std::string(chars, chars + data.size()));
  }

  file_descriptor pidfd(static_cast<int>(syscall(SYS_pidfd_open, pid, 0)));
  if (!pidfd) {
    error::send_errno("could not open pidfd");
  }

  std::shared_ptr<posix_child> child(new posix_child(loop, pid, std::move(pidfd)));
  for (std::size_t i = 0; i < slots.size(); ++i) {
    auto& s = slots[i];
    if (!s.parent_end) continue;
    if (s.mode == stdio_mode::ipc) {
      child->channel_ = std::make_unique<ipc_channel>(loop, std::move(s.parent_end));
    } else if (i == 0) {
      child->stdin_ =
          std::make_unique<fd_writable>(s.parent_end.release(), true, &loop);
    } else {
      auto stream = std::make_unique<fd_readable>(loop, s.parent_end.release(),
                                                  true, true);
      stream->on_end([raw = child.get()] { raw->maybe_close(); });
      (i == 1 ? child->stdout_ : child->stderr_) = std::move(stream);
    }
  }
  return child;
}

fgproxy::posix_child::posix_child(event_loop& loop, pid_t pid,
                                  file_descriptor pidfd)
    : loop_(&loop), pid_(pid), pidfd_(std::move(pidfd)) {
  pid_watch_ = loop_->watch(pidfd_.get(), [this] { reap(); });
}

fgproxy::posix_child::~posix_child() {
  if (pid_watch_) {
    loop_->unwatch(*pid_watch_);
  }
}

void fgproxy::posix_child::reap() {
  int wait_status;
  pid_t got;
  while ((got = waitpid(pid_, &wait_status, WNOHANG)) < 0 and errno == EINTR) {
  }
  if (got < 0) {
    error::send_errno("could not wait for child " + std::to_string(pid_));
  }
  if (got == 0) return;

  loop_->unwatch(*pid_watch_);
  pid_watch_.reset();
  status_ = exit_status(wait_status);

  // Deliver what the child sent before it went away.
  if (channel_) {
    channel_->drain();
  }
  maybe_close();
}

void fgproxy::posix_child::maybe_close() {
  if (closed_ or !status_) return;
  if (stdout_ and !stdout_->ended()) return;
  if (stderr_ and !stderr_->ended()) return;

  closed_ = true;
  // A close listener may drop the last outside reference.
  auto self = shared_from_this();
  close_.emit(*status_);
}

fgproxy::listener_id fgproxy::posix_child::on_close(close_listener fn) {
  return close_.add(std::move(fn));
}

void fgproxy::posix_child::remove_close_listener(listener_id id) {
  close_.remove(id);
}

bool fgproxy::posix_child::connected() const {
  return channel_ != nullptr and channel_->connected();
}

bool fgproxy::posix_child::send(ipc_message const& message) {
  return channel_ != nullptr and channel_->send(message);
}

fgproxy::listener_id fgproxy::posix_child::on_message(message_listener fn) {
  if (!channel_) return next_listener_id();
  return channel_->on_message(std::move(fn));
}

void fgproxy::posix_child::remove_message_listener(listener_id id) {
  if (channel_) {
    channel_->remove_message_listener(id);
  }
}

bool fgproxy::posix_child::kill(int signo) {
  if (status_) return false;
  if (syscall(SYS_pidfd_send_signal, pidfd_.get(), signo, nullptr, 0) < 0) {
    if (errno == ESRCH) return false;
    error::send_errno("could not send signal to child " + std::to_string(pid_));
  }
  return true;
}
