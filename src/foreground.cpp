#include <signal.h>

#include <libfgproxy/error.hpp>
#include <libfgproxy/foreground.hpp>
#include <libfgproxy/relay.hpp>
#include <libfgproxy/stdio_policy.hpp>
#include <libfgproxy/watchdog.hpp>

namespace {
enum class proxy_stage {
  spawned,
  proxying,
  closing,
  closed,
};

struct proxy_session {
  fgproxy::process_handle* parent = nullptr;
  std::shared_ptr<fgproxy::child_process> child;
  std::unique_ptr<fgproxy::watchdog> dog;
  proxy_stage stage = proxy_stage::spawned;

  fgproxy::relay_handle signals;
  fgproxy::relay_handle streams;
  fgproxy::relay_handle messages;
  fgproxy::listener_id exit_listener = 0;
  fgproxy::listener_id close_listener = 0;
  std::promise<fgproxy::close_action> close;
};

void on_child_close(std::shared_ptr<proxy_session> const& session,
                    fgproxy::exit_status const& status) {
  if (session->stage != proxy_stage::proxying) return;
  session->stage = proxy_stage::closing;

  session->messages.detach();
  session->streams.detach();
  session->signals.detach();
  session->parent->remove_exit_listener(session->exit_listener);
  session->child->remove_close_listener(session->close_listener);
  if (session->dog) {
    session->dog->dismiss();
  }

  session->stage = proxy_stage::closed;
  session->close.set_value(fgproxy::close_action(*session->parent, status));
  session->child.reset();
}

std::future<fgproxy::close_action> start_proxy(
    fgproxy::process_handle& parent,
    std::shared_ptr<fgproxy::child_process> child,
    std::unique_ptr<fgproxy::watchdog> dog) {
  auto session = std::make_shared<proxy_session>();
  session->parent = &parent;
  session->child = std::move(child);
  session->dog = std::move(dog);
  auto future = session->close.get_future();

  auto& proxied = *session->child;
  session->signals = fgproxy::attach_signals(parent, proxied);
  session->streams = fgproxy::attach_streams(parent, proxied);
  session->messages = fgproxy::attach_messages(parent, proxied);
  session->exit_listener =
      parent.on_exit([&proxied](int) { proxied.kill(SIGHUP); });
  session->stage = proxy_stage::proxying;

  // The session owns the child and the child's listener owns the session
  // until the close event breaks the cycle.
  session->close_listener = proxied.on_close(
      [session](fgproxy::exit_status const& status) {
        on_child_close(session, status);
      });
  return future;
}

std::shared_ptr<fgproxy::child_process> launch_here(
    std::string const& file, std::vector<std::string> const& args,
    fgproxy::launch_options const& options) {
  auto& loop = fgproxy::current_process::instance().loop();
  return fgproxy::posix_child::launch(loop, file, args, options);
}
}  // namespace

std::future<fgproxy::close_action> fgproxy::proxy(
    process_handle& parent, std::shared_ptr<child_process> child) {
  return start_proxy(parent, std::move(child), nullptr);
}

fgproxy::spawn_result fgproxy::spawn(std::string const& file,
                                     std::vector<std::string> const& args,
                                     spawn_options const& options) {
  process_handle& parent =
      options.parent ? *options.parent : current_process::instance();
  spawn_function const& launch = options.spawn ? options.spawn : launch_here;

  launch_options child_options = options;
  child_options.stdio = stdio_for(options.stdio, parent.can_send());

  auto child = launch(file, args, child_options);
  if (!child) {
    error::send("spawn function returned no child for " + file);
  }

  std::unique_ptr<watchdog> dog;
  if (options.watchdog and parent.is_current_process()) {
    dog = watchdog::start(child->pid());
  }

  auto close = start_proxy(parent, child, std::move(dog));
  return spawn_result{std::move(child), std::move(close)};
}

bool fgproxy::conclude(event_loop& loop, std::future<close_action>& close,
                       close_handler const& handler) {
  auto action = loop.wait(close);
  close_decision decision = use_computed{};
  if (handler) {
    decision = handler(action);
  }
  return settle(action, decision);
}

bool fgproxy::conclude_async(event_loop& loop,
                             std::future<close_action>& close,
                             async_close_handler const& handler) {
  auto action = loop.wait(close);
  if (!handler) {
    return settle(action, use_computed{});
  }
  auto pending = handler(action);
  return settle(action, loop.wait(pending));
}
