#include <signal.h>

#include <libfgproxy/compat.hpp>
#include <libfgproxy/error.hpp>
#include <libfgproxy/relay.hpp>
#include <libfgproxy/stdio_policy.hpp>

namespace {
struct legacy_session {
  std::shared_ptr<fgproxy::child_process> child;
  fgproxy::relay_handle signals;
  fgproxy::relay_handle messages;
  fgproxy::listener_id exit_listener = 0;
  fgproxy::listener_id close_listener = 0;
};

void on_legacy_close(std::shared_ptr<legacy_session> const& session,
                     fgproxy::close_handler const& callback,
                     fgproxy::exit_status const& status) {
  auto& parent = fgproxy::current_process::instance();
  parent.set_exit_code(status.signal ? 128 + *status.signal
                                     : status.code.value_or(0));

  session->child->remove_close_listener(session->close_listener);

  fgproxy::close_action::options options;
  options.use_pending_exit_code = true;
  options.teardown = [session, &parent] {
    session->signals.detach();
    parent.remove_exit_listener(session->exit_listener);
  };
  fgproxy::close_action action(parent, status, std::move(options));

  fgproxy::close_decision decision = fgproxy::use_computed{};
  if (callback) {
    decision = callback(action);
  }
  fgproxy::settle(action, decision);
  session->child.reset();
}
}  // namespace

std::shared_ptr<fgproxy::child_process> fgproxy::foreground_child(
    std::vector<std::string> const& command, close_handler callback) {
  if (command.empty()) {
    error::send("no program given");
  }
  std::vector<std::string> args(command.begin() + 1, command.end());
  return foreground_child(command.front(), args, std::move(callback));
}

std::shared_ptr<fgproxy::child_process> fgproxy::foreground_child(
    std::string const& program, std::vector<std::string> const& args,
    close_handler callback) {
  auto& parent = current_process::instance();

  launch_options options;
  options.stdio = stdio_for(stdio_mode::inherit, parent.can_send());
  auto child = posix_child::launch(parent.loop(), program, args, options);

  if (parent.can_send()) {
    parent.remove_all_message_listeners();
  }

  auto session = std::make_shared<legacy_session>();
  session->child = child;
  session->signals = attach_signals(parent, *child);
  session->messages = attach_messages(parent, *child);
  session->exit_listener =
      parent.on_exit([raw = child.get()](int) { raw->kill(SIGHUP); });
  session->close_listener = child->on_close(
      [session, callback = std::move(callback)](exit_status const& status) {
        on_legacy_close(session, callback, status);
      });
  return child;
}

std::shared_ptr<fgproxy::child_process> fgproxy::foreground_child(
    std::string const& program, std::initializer_list<std::string> args,
    close_handler callback) {
  return foreground_child(program, std::vector<std::string>(args),
                          std::move(callback));
}

std::shared_ptr<fgproxy::child_process> fgproxy::foreground_child(
    std::string const& program, close_handler callback) {
  return foreground_child(program, std::vector<std::string>{},
                          std::move(callback));
}
