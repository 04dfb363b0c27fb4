#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>

namespace fgproxy {
// Helper process that kills a child left behind when this process dies
// without a chance to forward anything (SIGKILL). The helper gets SIGHUP from
// the kernel when its parent dies, gives the child grace_period to exit on
// its own and then SIGKILLs it. Best effort: if the helper is killed along
// with the parent, the child survives.
class watchdog {
 public:
  static constexpr std::chrono::milliseconds grace_period{500};

  static std::unique_ptr<watchdog> start(pid_t child);

  watchdog() = delete;
  watchdog(const watchdog&) = delete;
  watchdog& operator=(const watchdog&) = delete;
  ~watchdog();

  // Kills and reaps the helper. Safe to call more than once.
  void dismiss();

  pid_t pid() const { return pid_; }
  pid_t child() const { return child_; }

 private:
  watchdog(pid_t pid, pid_t child) : pid_(pid), child_(child) {}

  pid_t pid_ = 0;
  pid_t child_ = 0;
};
}  // namespace fgproxy
