#pragma once

#include <chrono>
#include <functional>
#include <libfgproxy/child_process.hpp>
#include <libfgproxy/process_handle.hpp>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>

namespace fgproxy {
// What a close handler wants done with the parent.
struct use_computed {};
struct override_signal {
  int signo;
};
struct override_code {
  int code;
};
struct suppress {};

using close_decision =
    std::variant<use_computed, override_signal, override_code, suppress>;

// "SIGTERM" or "TERM". Throws error for anything else.
override_signal signal_named(std::string_view name);

// Terminates the parent the way the child terminated. Copies share state:
// whichever copy runs first wins and every later call does nothing.
class close_action {
 public:
  // Delay kept alive after re-raising a signal on the current process, so the
  // process cannot finish gracefully before the signal lands.
  static constexpr std::chrono::milliseconds signal_delay{200};

  struct options {
    // Runs once, before the parent is terminated or released.
    std::function<void()> teardown;
    // Exit with the parent's pending exit code rather than the child's.
    bool use_pending_exit_code = false;
  };

  close_action(process_handle& parent, exit_status status);
  close_action(process_handle& parent, exit_status status, options opts);

  // Re-raises the child's signal, or exits with its code.
  void operator()() const;
  void raise(int signo) const;
  void exit(int code) const;
  // Tears down without terminating the parent.
  void release() const;

  std::optional<int> exit_code() const { return status_.code; }
  std::optional<int> signal() const { return status_.signal; }
  bool invoked() const { return state_->invoked; }
  process_handle& parent() const { return *parent_; }

 private:
  struct shared_state {
    bool invoked = false;
    std::function<void()> teardown;
  };

  bool begin() const;

  process_handle* parent_;
  exit_status status_;
  bool use_pending_exit_code_ = false;
  std::shared_ptr<shared_state> state_;
};

// Applies a decision. Returns true if the parent was asked to terminate.
bool settle(close_action const& action, close_decision const& decision);
}  // namespace fgproxy
