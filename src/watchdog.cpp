#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <libfgproxy/error.hpp>
#include <libfgproxy/watchdog.hpp>

namespace {
void detach_descriptors() {
  auto null = open("/dev/null", O_RDWR);
  if (null >= 0) {
    dup2(null, STDIN_FILENO);
    dup2(null, STDOUT_FILENO);
    dup2(null, STDERR_FILENO);
  }
#ifdef SYS_close_range
  if (syscall(SYS_close_range, 3U, ~0U, 0U) == 0) return;
#endif
  for (int fd = 3, max = static_cast<int>(sysconf(_SC_OPEN_MAX)); fd < max;
       ++fd) {
    close(fd);
  }
}

// Body of the helper process.
[[noreturn]] void guard(pid_t parent, pid_t child) {
  sigset_t hangup;
  sigemptyset(&hangup);
  sigaddset(&hangup, SIGHUP);
  sigprocmask(SIG_SETMASK, &hangup, nullptr);

  // Keep terminal signals meant for the foreground job away from us.
  setpgid(0, 0);
  prctl(PR_SET_NAME, "fgproxy-watchdog");
  if (prctl(PR_SET_PDEATHSIG, SIGHUP) < 0) {
    _exit(1);
  }
  detach_descriptors();

  // Pin the child now; its pid may be reused once it is gone.
  auto pidfd = static_cast<int>(syscall(SYS_pidfd_open, child, 0));
  if (pidfd < 0) {
    _exit(0);
  }

  // A hangup from a terminal is not our parent dying.
  while (getppid() == parent) {
    if (sigwaitinfo(&hangup, nullptr) < 0 and errno != EINTR) {
      _exit(1);
    }
  }

  pollfd exited{pidfd, POLLIN, 0};
  auto grace = static_cast<int>(fgproxy::watchdog::grace_period.count());
  while (poll(&exited, 1, grace) < 0) {
    if (errno != EINTR) _exit(1);
  }
  if (!(exited.revents & POLLIN)) {
    syscall(SYS_pidfd_send_signal, pidfd, SIGKILL, nullptr, 0);
  }
  _exit(0);
}
}  // namespace

std::unique_ptr<fgproxy::watchdog> fgproxy::watchdog::start(pid_t child) {
  auto parent = getpid();
  pid_t pid = fork();
  if (pid < 0) {
    error::send_errno("could not fork watchdog");
  }
  if (pid == 0) {
    guard(parent, child);
  }
  return std::unique_ptr<watchdog>(new watchdog(pid, child));
}

fgproxy::watchdog::~watchdog() { dismiss(); }

void fgproxy::watchdog::dismiss() {
  if (pid_ != 0) {
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = 0;
  }
}
