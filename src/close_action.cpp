#include <libfgproxy/close_action.hpp>
#include <libfgproxy/error.hpp>
#include <libfgproxy/signals.hpp>
#include <string>

fgproxy::override_signal fgproxy::signal_named(std::string_view name) {
  auto signo = signal_number(name);
  if (!signo) {
    error::send("unknown signal name: " + std::string(name));
  }
  return override_signal{*signo};
}

fgproxy::close_action::close_action(process_handle& parent, exit_status status)
    : close_action(parent, std::move(status), options{}) {}

fgproxy::close_action::close_action(process_handle& parent, exit_status status,
                                    options opts)
    : parent_(&parent),
      status_(std::move(status)),
      use_pending_exit_code_(opts.use_pending_exit_code),
      state_(std::make_shared<shared_state>()) {
  state_->teardown = std::move(opts.teardown);
}

bool fgproxy::close_action::begin() const {
  if (state_->invoked) return false;
  state_->invoked = true;
  if (auto teardown = std::move(state_->teardown)) {
    state_->teardown = nullptr;
    teardown();
  }
  return true;
}

void fgproxy::close_action::operator()() const {
  if (status_.signal) {
    raise(*status_.signal);
    return;
  }
  auto code = status_.code.value_or(0);
  if (use_pending_exit_code_) {
    code = parent_->exit_code().value_or(code);
  }
  exit(code);
}

void fgproxy::close_action::raise(int signo) const {
  if (!begin()) return;
  if (parent_->is_current_process()) {
    parent_->keep_alive(signal_delay);
  }
  parent_->kill(parent_->pid(), signo);
}

void fgproxy::close_action::exit(int code) const {
  if (!begin()) return;
  parent_->exit(code);
}

void fgproxy::close_action::release() const { begin(); }

bool fgproxy::settle(close_action const& action,
                     close_decision const& decision) {
  if (std::holds_alternative<suppress>(decision)) {
    action.release();
    return false;
  }
  if (auto sig = std::get_if<override_signal>(&decision)) {
    action.raise(sig->signo);
  } else if (auto code = std::get_if<override_code>(&decision)) {
    action.exit(code->code);
  } else {
    action();
  }
  return true;
}
