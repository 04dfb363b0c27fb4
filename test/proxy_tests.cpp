#include <signal.h>

#include <catch2/catch_test_macros.hpp>
#include <future>
#include <libfgproxy/close_action.hpp>
#include <libfgproxy/compat.hpp>
#include <libfgproxy/error.hpp>
#include <libfgproxy/event.hpp>
#include <libfgproxy/foreground.hpp>
#include <libfgproxy/pipe.hpp>
#include <libfgproxy/relay.hpp>
#include <libfgproxy/signals.hpp>
#include <libfgproxy/stdio_policy.hpp>
#include <memory>
#include <type_traits>

#include "fakes.hpp"

using fgproxy::stdio_mode;

namespace {
using modes = std::vector<stdio_mode>;

modes as_list(fgproxy::stdio_config const& config) {
  REQUIRE(std::holds_alternative<modes>(config));
  return std::get<modes>(config);
}

fgproxy::close_action closed_with(fakes::parent& parent,
                                  fgproxy::exit_status const& status) {
  auto child = std::make_shared<fakes::child>();
  auto close = fgproxy::proxy(parent, child);
  child->close(status);
  return close.get();
}
}  // namespace

TEST_CASE("fgproxy::stdio_for defaults to inherit", "[stdio]") {
  auto config = fgproxy::stdio_for(std::nullopt, false);
  REQUIRE(std::get<stdio_mode>(config) == stdio_mode::inherit);
}

TEST_CASE("fgproxy::stdio_for leaves stdio alone without ipc", "[stdio]") {
  REQUIRE(std::get<stdio_mode>(fgproxy::stdio_for(stdio_mode::pipe, false)) ==
          stdio_mode::pipe);

  modes list = {stdio_mode::ignore, stdio_mode::inherit, stdio_mode::pipe};
  REQUIRE(as_list(fgproxy::stdio_for(list, false)) == list);
}

TEST_CASE("fgproxy::stdio_for adds an ipc channel", "[stdio]") {
  REQUIRE(as_list(fgproxy::stdio_for(stdio_mode::inherit, true)) ==
          modes{stdio_mode::inherit, stdio_mode::inherit, stdio_mode::inherit,
                stdio_mode::ipc});
  REQUIRE(as_list(fgproxy::stdio_for(std::nullopt, true)) ==
          modes{stdio_mode::inherit, stdio_mode::inherit, stdio_mode::inherit,
                stdio_mode::ipc});

  modes list = {stdio_mode::pipe, stdio_mode::ignore, stdio_mode::inherit};
  REQUIRE(as_list(fgproxy::stdio_for(list, true)) ==
          modes{stdio_mode::pipe, stdio_mode::ignore, stdio_mode::inherit,
                stdio_mode::ipc});

  REQUIRE(as_list(fgproxy::stdio_for(modes{stdio_mode::ignore}, true)) ==
          modes{stdio_mode::ignore, stdio_mode::pipe, stdio_mode::pipe,
                stdio_mode::ipc});
}

TEST_CASE("fgproxy::stdio_for never adds a second ipc channel", "[stdio]") {
  modes list = {stdio_mode::pipe, stdio_mode::pipe, stdio_mode::pipe,
                stdio_mode::ipc};
  auto once = as_list(fgproxy::stdio_for(list, true));
  REQUIRE(once == list);
  REQUIRE(as_list(fgproxy::stdio_for(once, true)) == list);
}

TEST_CASE("fgproxy::expand_stdio covers the standard descriptors", "[stdio]") {
  REQUIRE(fgproxy::expand_stdio(stdio_mode::ignore) ==
          modes{stdio_mode::ignore, stdio_mode::ignore, stdio_mode::ignore});
  REQUIRE(fgproxy::expand_stdio(modes{stdio_mode::inherit}) ==
          modes{stdio_mode::inherit, stdio_mode::pipe, stdio_mode::pipe});
  REQUIRE(fgproxy::parse_stdio_mode("ignore") == stdio_mode::ignore);
  REQUIRE_FALSE(fgproxy::parse_stdio_mode("tty"));
}

TEST_CASE("fgproxy::relay_signals covers catchable termination signals",
          "[signals]") {
  auto const& signals = fgproxy::relay_signals();
  auto has = [&](int signo) {
    return std::find(signals.begin(), signals.end(), signo) != signals.end();
  };
  REQUIRE(has(SIGINT));
  REQUIRE(has(SIGTERM));
  REQUIRE(has(SIGHUP));
  REQUIRE(has(SIGQUIT));
  REQUIRE_FALSE(has(SIGKILL));
  REQUIRE_FALSE(has(SIGSTOP));
  REQUIRE_FALSE(has(SIGCHLD));
}

TEST_CASE("fgproxy::signal_name and signal_number agree", "[signals]") {
  REQUIRE(fgproxy::signal_name(SIGTERM) == "SIGTERM");
  REQUIRE(fgproxy::signal_number("SIGINT") == SIGINT);
  REQUIRE(fgproxy::signal_number("HUP") == SIGHUP);
  REQUIRE_FALSE(fgproxy::signal_number("SIGNOPE"));
  REQUIRE_FALSE(fgproxy::signal_number("SIG"));
  for (auto signo : fgproxy::relay_signals()) {
    REQUIRE(fgproxy::signal_number(fgproxy::signal_name(signo)) == signo);
  }
}

TEST_CASE("fgproxy::event skips listeners removed during emit", "[event]") {
  fgproxy::event<int> ev;
  int first = 0;
  int second = 0;
  fgproxy::listener_id second_id = 0;
  ev.add([&](int value) {
    first += value;
    ev.remove(second_id);
  });
  second_id = ev.add([&](int value) { second += value; });

  ev.emit(3);
  REQUIRE(first == 3);
  REQUIRE(second == 0);
  REQUIRE(ev.size() == 1);
}

TEST_CASE("fgproxy::relay_handle detaches exactly once", "[relay]") {
  int detached = 0;
  {
    fgproxy::relay_handle handle([&] { ++detached; });
    REQUIRE(handle.attached());
    handle.detach();
    handle.detach();
    REQUIRE_FALSE(handle.attached());
  }
  REQUIRE(detached == 1);

  {
    fgproxy::relay_handle moved_from([&] { ++detached; });
    fgproxy::relay_handle moved_to(std::move(moved_from));
  }
  REQUIRE(detached == 2);

  fgproxy::relay_handle inert;
  inert.detach();
}

TEST_CASE("fgproxy::attach_signals forwards to the child", "[relay]") {
  fakes::parent parent;
  fakes::child child;

  auto relay = fgproxy::attach_signals(parent, child);
  REQUIRE(parent.signal_listener_count() == fgproxy::relay_signals().size());

  for (auto signo : fgproxy::relay_signals()) {
    parent.raise(signo);
  }
  REQUIRE(child.kills == fgproxy::relay_signals());

  relay.detach();
  REQUIRE(parent.signal_listener_count() == 0);
  relay.detach();
  REQUIRE(parent.signal_listener_count() == 0);

  parent.raise(SIGTERM);
  REQUIRE(child.kills.size() == fgproxy::relay_signals().size());
}

TEST_CASE("fgproxy::attach_signals relays are independent", "[relay]") {
  fakes::parent parent;
  fakes::child first;
  fakes::child second;

  auto one = fgproxy::attach_signals(parent, first);
  auto two = fgproxy::attach_signals(parent, second);
  one.detach();

  parent.raise(SIGUSR2);
  REQUIRE(first.kills.empty());
  REQUIRE(second.kills == std::vector<int>{SIGUSR2});

  two.detach();
  REQUIRE(parent.signal_listener_count() == 0);
}

TEST_CASE("fgproxy::attach_streams wires existing streams", "[relay]") {
  fakes::parent parent;
  fakes::child child(true);

  auto relay = fgproxy::attach_streams(parent, child);
  REQUIRE(child.out_.pipe_count() == 1);
  REQUIRE(child.err_.pipe_count() == 1);
  REQUIRE(parent.in_.pipe_count() == 1);

  child.out_.push("out");
  child.err_.push("err");
  parent.in_.push("in");
  REQUIRE(parent.out_.text == "out");
  REQUIRE(parent.err_.text == "err");
  REQUIRE(child.in_.text == "in");

  relay.detach();
  relay.detach();
  REQUIRE(child.out_.pipe_count() == 0);
  REQUIRE(child.err_.pipe_count() == 0);
  REQUIRE(parent.in_.pipe_count() == 0);
}

TEST_CASE("fgproxy::attach_streams skips inherited streams", "[relay]") {
  fakes::parent parent;
  fakes::child child(false);

  auto relay = fgproxy::attach_streams(parent, child);
  REQUIRE(parent.in_.pipe_count() == 0);
  relay.detach();
  REQUIRE(parent.in_.pipe_count() == 0);
}

TEST_CASE("fgproxy::attach_messages is inert without ipc", "[relay]") {
  fakes::parent parent(false);
  fakes::child child;

  auto relay = fgproxy::attach_messages(parent, child);
  REQUIRE_FALSE(relay.attached());
  REQUIRE(parent.message_listener_count() == 0);
  REQUIRE(child.message_listener_count() == 0);
  relay.detach();
  relay.detach();
}

TEST_CASE("fgproxy::attach_messages forwards both ways", "[relay]") {
  fakes::parent parent(true);
  fakes::child child;

  auto relay = fgproxy::attach_messages(parent, child);
  REQUIRE(parent.message_listener_count() == 1);
  REQUIRE(child.message_listener_count() == 1);

  fgproxy::pipe handle(true);
  fgproxy::ipc_message up{"from child",
                          fgproxy::file_descriptor(handle.release_read())};
  child.message(up);
  parent.deliver(fgproxy::ipc_message{"from parent", {}});

  REQUIRE(parent.sent.size() == 1);
  REQUIRE(parent.sent[0].payload == "from child");
  REQUIRE(parent.sent[0].had_handle);
  REQUIRE(child.sent.size() == 1);
  REQUIRE(child.sent[0].payload == "from parent");
  REQUIRE_FALSE(child.sent[0].had_handle);

  relay.detach();
  REQUIRE(parent.message_listener_count() == 0);
  REQUIRE(child.message_listener_count() == 0);
}

TEST_CASE("fgproxy::proxy mirrors every exit code", "[close]") {
  for (int code = 0; code <= 255; ++code) {
    fakes::parent parent;
    auto action = closed_with(parent, fgproxy::exit_status::exited(code));
    REQUIRE(action.exit_code() == code);
    REQUIRE_FALSE(action.signal());

    action();
    REQUIRE(parent.exits == std::vector<int>{code});
    REQUIRE(parent.kills.empty());
  }
}

TEST_CASE("fgproxy::proxy mirrors terminating signals", "[close]") {
  auto signals = fgproxy::relay_signals();
  signals.push_back(SIGKILL);
  signals.push_back(SIGSEGV);
  for (auto signo : signals) {
    fakes::parent parent;
    auto action = closed_with(parent, fgproxy::exit_status::signaled(signo));
    REQUIRE(action.signal() == signo);
    REQUIRE_FALSE(action.exit_code());

    action();
    REQUIRE(parent.exits.empty());
    REQUIRE(parent.kills == std::vector<std::pair<pid_t, int>>{{4242, signo}});
    REQUIRE(parent.keep_alives.empty());
  }
}

TEST_CASE("fgproxy::close_action keeps the current process alive for the signal",
          "[close]") {
  fakes::parent parent;
  parent.pretend_current = true;
  auto action = closed_with(parent, fgproxy::exit_status::signaled(SIGTERM));
  action();
  REQUIRE(parent.keep_alives ==
          std::vector<std::chrono::milliseconds>{fgproxy::close_action::signal_delay});
  REQUIRE(parent.kills.size() == 1);
}

TEST_CASE("fgproxy::close_action runs once across copies", "[close]") {
  fakes::parent parent;
  auto action = closed_with(parent, fgproxy::exit_status::exited(3));
  auto copy = action;
  action();
  copy();
  action.exit(9);
  REQUIRE(parent.exits == std::vector<int>{3});
  REQUIRE(copy.invoked());
}

TEST_CASE("fgproxy::proxy tears everything down on close", "[close]") {
  fakes::parent parent(true);
  auto child = std::make_shared<fakes::child>(true);
  auto close = fgproxy::proxy(parent, child);

  REQUIRE(parent.signal_listener_count() > 0);
  REQUIRE(parent.message_listener_count() == 1);
  REQUIRE(parent.exit_listener_count() == 1);
  REQUIRE(child->out_.pipe_count() == 1);
  REQUIRE(close.wait_for(std::chrono::seconds(0)) == std::future_status::timeout);

  child->close(fgproxy::exit_status::exited(0));
  REQUIRE(close.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  REQUIRE(parent.signal_listener_count() == 0);
  REQUIRE(parent.message_listener_count() == 0);
  REQUIRE(parent.exit_listener_count() == 0);
  REQUIRE(child->message_listener_count() == 0);
  REQUIRE(child->close_listener_count() == 0);
  REQUIRE(child->out_.pipe_count() == 0);
  REQUIRE(child->err_.pipe_count() == 0);
  REQUIRE(parent.in_.pipe_count() == 0);
  REQUIRE(parent.exits.empty());
}

TEST_CASE("fgproxy::proxy hangs up the child when the parent exits", "[close]") {
  fakes::parent parent;
  auto child = std::make_shared<fakes::child>();
  auto close = fgproxy::proxy(parent, child);

  parent.exiting(0);
  REQUIRE(child->kills == std::vector<int>{SIGHUP});

  child->close(fgproxy::exit_status::signaled(SIGHUP));
  parent.exiting(0);
  REQUIRE(child->kills.size() == 1);
}

TEST_CASE("fgproxy::conclude applies hook decisions", "[close]") {
  fgproxy::event_loop loop;

  SECTION("suppress keeps the parent running") {
    fakes::parent parent;
    auto child = std::make_shared<fakes::child>();
    auto close = fgproxy::proxy(parent, child);
    child->close(fgproxy::exit_status::exited(1));

    auto terminated = fgproxy::conclude(
        loop, close, [](fgproxy::close_action const&) -> fgproxy::close_decision {
          return fgproxy::suppress{};
        });
    REQUIRE_FALSE(terminated);
    REQUIRE(parent.exits.empty());
    REQUIRE(parent.kills.empty());
  }

  SECTION("a signal name replaces the exit code") {
    fakes::parent parent;
    auto child = std::make_shared<fakes::child>();
    auto close = fgproxy::proxy(parent, child);
    child->close(fgproxy::exit_status::exited(0));

    fgproxy::conclude(loop, close,
                      [](fgproxy::close_action const&) -> fgproxy::close_decision {
                        return fgproxy::signal_named("SIGTERM");
                      });
    REQUIRE(parent.exits.empty());
    REQUIRE(parent.kills == std::vector<std::pair<pid_t, int>>{{4242, SIGTERM}});
  }

  SECTION("a code replaces the signal") {
    fakes::parent parent;
    auto child = std::make_shared<fakes::child>();
    auto close = fgproxy::proxy(parent, child);
    child->close(fgproxy::exit_status::signaled(SIGINT));

    fgproxy::conclude(loop, close,
                      [](fgproxy::close_action const&) -> fgproxy::close_decision {
                        return fgproxy::override_code{2};
                      });
    REQUIRE(parent.exits == std::vector<int>{2});
    REQUIRE(parent.kills.empty());
  }

  SECTION("no hook uses the computed action") {
    fakes::parent parent;
    auto child = std::make_shared<fakes::child>();
    auto close = fgproxy::proxy(parent, child);
    child->close(fgproxy::exit_status::exited(4));

    REQUIRE(fgproxy::conclude(loop, close));
    REQUIRE(parent.exits == std::vector<int>{4});
  }
}

TEST_CASE("fgproxy::conclude_async waits for the hook", "[close]") {
  fgproxy::event_loop loop;
  fakes::parent parent;
  auto child = std::make_shared<fakes::child>();
  auto close = fgproxy::proxy(parent, child);
  child->close(fgproxy::exit_status::exited(0));

  std::promise<fgproxy::close_decision> decided;
  auto hook = [&](fgproxy::close_action const& action) {
    REQUIRE(action.exit_code() == 0);
    decided.set_value(fgproxy::override_code{7});
    return decided.get_future();
  };
  REQUIRE(fgproxy::conclude_async(loop, close, hook));
  REQUIRE(parent.exits == std::vector<int>{7});
}

TEST_CASE("fgproxy::conclude lets hook failures through", "[close]") {
  fgproxy::event_loop loop;
  fakes::parent parent;
  auto child = std::make_shared<fakes::child>();
  auto close = fgproxy::proxy(parent, child);
  child->close(fgproxy::exit_status::exited(0));

  auto hook = [](fgproxy::close_action const&) -> fgproxy::close_decision {
    throw std::runtime_error("cleanup failed");
  };
  REQUIRE_THROWS_AS(fgproxy::conclude(loop, close, hook), std::runtime_error);
  REQUIRE(parent.exits.empty());
}

TEST_CASE("fgproxy::signal_named rejects unknown names", "[close]") {
  REQUIRE(fgproxy::signal_named("SIGUSR1").signo == SIGUSR1);
  REQUIRE_THROWS_AS(fgproxy::signal_named("SIGWHATEVER"), fgproxy::error);
}

TEST_CASE("fgproxy::spawn prepares stdio for the parent", "[spawn]") {
  std::vector<fgproxy::launch_options> seen;
  auto fake_spawn = [&](std::string const&, std::vector<std::string> const&,
                        fgproxy::launch_options const& options) {
    seen.push_back(options);
    return std::make_shared<fakes::child>();
  };

  SECTION("inherit when nothing is asked for") {
    fakes::parent parent(false);
    fgproxy::spawn_options options;
    options.parent = &parent;
    options.spawn = fake_spawn;
    options.cwd = "/tmp";
    auto result = fgproxy::spawn("prog", {"a"}, options);

    REQUIRE(seen.size() == 1);
    REQUIRE(std::get<stdio_mode>(*seen[0].stdio) == stdio_mode::inherit);
    REQUIRE(seen[0].cwd == std::filesystem::path("/tmp"));
  }

  SECTION("an ipc slot when the parent has a channel") {
    fakes::parent parent(true);
    fgproxy::spawn_options options;
    options.parent = &parent;
    options.spawn = fake_spawn;
    auto result = fgproxy::spawn("prog", {}, options);

    REQUIRE(as_list(*seen[0].stdio) ==
            modes{stdio_mode::inherit, stdio_mode::inherit, stdio_mode::inherit,
                  stdio_mode::ipc});
    REQUIRE(parent.message_listener_count() == 1);
  }

  SECTION("the caller's mode is kept") {
    fakes::parent parent(false);
    fgproxy::spawn_options options;
    options.parent = &parent;
    options.spawn = fake_spawn;
    options.stdio = stdio_mode::pipe;
    auto result = fgproxy::spawn("prog", {}, options);

    REQUIRE(std::get<stdio_mode>(*seen[0].stdio) == stdio_mode::pipe);
  }
}

TEST_CASE("fgproxy::spawn rejects a spawn function without a child",
          "[spawn]") {
  fakes::parent parent;
  fgproxy::spawn_options options;
  options.parent = &parent;
  options.spawn = [](std::string const&, std::vector<std::string> const&,
                     fgproxy::launch_options const&) {
    return std::shared_ptr<fgproxy::child_process>();
  };
  REQUIRE_THROWS_AS(fgproxy::spawn("prog", {}, options), fgproxy::error);
}

TEST_CASE("fgproxy::foreground_child accepts every call shape", "[legacy]") {
  using child_ptr = std::shared_ptr<fgproxy::child_process>;
  auto callback = [](fgproxy::close_action const&) {
    return fgproxy::close_decision{fgproxy::suppress{}};
  };
  std::vector<std::string> command = {"prog", "arg"};
  std::vector<std::string> args = {"arg"};

  STATIC_REQUIRE(std::is_same_v<decltype(fgproxy::foreground_child("prog")),
                                child_ptr>);
  STATIC_REQUIRE(
      std::is_same_v<decltype(fgproxy::foreground_child("prog", callback)),
                     child_ptr>);
  STATIC_REQUIRE(
      std::is_same_v<decltype(fgproxy::foreground_child("prog", {"a", "b"})),
                     child_ptr>);
  STATIC_REQUIRE(std::is_same_v<decltype(fgproxy::foreground_child(
                                    "prog", {"a", "b"}, callback)),
                                child_ptr>);
  STATIC_REQUIRE(
      std::is_same_v<decltype(fgproxy::foreground_child("prog", args)),
                     child_ptr>);
  STATIC_REQUIRE(
      std::is_same_v<decltype(fgproxy::foreground_child(command, callback)),
                     child_ptr>);
}
