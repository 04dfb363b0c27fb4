#include <unistd.h>

#include <libfgproxy/compat.hpp>
#include <libfgproxy/error.hpp>
#include <libfgproxy/foreground.hpp>
#include <libfgproxy/signals.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

extern char** environ;

namespace {
struct command_line {
  std::optional<std::string> cwd;
  std::optional<fgproxy::stdio_mode> stdio;
  std::optional<std::string> on_close;
  bool watchdog = true;
  bool legacy = false;
  bool help = false;
  std::vector<std::string> command;
};

void print_usage(std::ostream& out) {
  out << "usage: fgproxy [options] [--] program [args...]\n"
         "\n"
         "Runs program in the foreground: signals, stdio and IPC messages are\n"
         "relayed to it, and fgproxy exits the way it exits.\n"
         "\n"
         "  -C, --cwd DIR       run program in DIR\n"
         "  -s, --stdio MODE    inherit (default), pipe or ignore\n"
         "      --no-watchdog   do not guard against fgproxy being SIGKILLed\n"
         "      --legacy        use the legacy foreground_child entry point\n"
         "      --on-close CMD  run CMD with /bin/sh once program closed; a\n"
         "                      non-zero status becomes the exit code\n"
         "  -h, --help          show this help\n";
}

command_line parse(int argc, const char** argv) {
  command_line line;
  int i = 1;
  auto value_of = [&](std::string_view flag) {
    if (i + 1 >= argc) {
      fgproxy::error::send("missing value for " + std::string(flag));
    }
    return std::string(argv[++i]);
  };

  for (; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--") {
      ++i;
      break;
    }
    if (arg.empty() or arg[0] != '-') break;

    if (arg == "-h" or arg == "--help") {
      line.help = true;
    } else if (arg == "-C" or arg == "--cwd") {
      line.cwd = value_of(arg);
    } else if (arg == "-s" or arg == "--stdio") {
      auto text = value_of(arg);
      auto mode = fgproxy::parse_stdio_mode(text);
      if (!mode or *mode == fgproxy::stdio_mode::ipc) {
        fgproxy::error::send("invalid stdio mode: " + text);
      }
      line.stdio = mode;
    } else if (arg == "--no-watchdog") {
      line.watchdog = false;
    } else if (arg == "--legacy") {
      line.legacy = true;
    } else if (arg == "--on-close") {
      line.on_close = value_of(arg);
    } else {
      fgproxy::error::send("unknown option: " + std::string(arg));
    }
  }

  for (; i < argc; ++i) {
    line.command.emplace_back(argv[i]);
  }
  if (!line.help and line.command.empty()) {
    fgproxy::error::send("no program given");
  }
  if (line.legacy and (line.on_close or line.cwd or line.stdio or !line.watchdog)) {
    fgproxy::error::send("--legacy cannot be combined with other options");
  }
  return line;
}

// Our environment plus how the child ended, for the --on-close command.
std::vector<std::string> hook_environment(
    fgproxy::close_action const& action) {
  std::string const code_prefix = "FGPROXY_CHILD_CODE=";
  std::string const signal_prefix = "FGPROXY_CHILD_SIGNAL=";

  std::vector<std::string> env;
  for (auto entry = environ; *entry != nullptr; ++entry) {
    std::string_view text = *entry;
    if (text.substr(0, code_prefix.size()) == code_prefix or
        text.substr(0, signal_prefix.size()) == signal_prefix) {
      continue;
    }
    env.emplace_back(text);
  }

  env.push_back(code_prefix +
                (action.exit_code() ? std::to_string(*action.exit_code()) : ""));
  env.push_back(signal_prefix +
                (action.signal() ? fgproxy::signal_name(*action.signal()) : ""));
  return env;
}

// Runs the --on-close command. Its close settles the returned future.
std::future<fgproxy::close_decision> run_hook(
    std::string const& command, fgproxy::close_action const& action,
    std::shared_ptr<fgproxy::child_process>& hook) {
  auto& loop = fgproxy::current_process::instance().loop();
  fgproxy::launch_options options;
  options.stdio = fgproxy::stdio_mode::inherit;
  options.env = hook_environment(action);
  hook = fgproxy::posix_child::launch(loop, "/bin/sh", {"-c", command}, options);

  auto decision = std::make_shared<std::promise<fgproxy::close_decision>>();
  hook->on_close([decision](fgproxy::exit_status const& status) {
    if (status.code.value_or(0) > 0) {
      decision->set_value(fgproxy::override_code{*status.code});
    } else {
      decision->set_value(fgproxy::use_computed{});
    }
  });
  return decision->get_future();
}

int run_modern(command_line const& line) {
  auto& self = fgproxy::current_process::instance();

  fgproxy::spawn_options options;
  if (line.cwd) options.cwd = *line.cwd;
  if (line.stdio) options.stdio = *line.stdio;
  options.watchdog = line.watchdog;

  std::vector<std::string> args(line.command.begin() + 1, line.command.end());
  auto result = fgproxy::spawn(line.command.front(), args, options);

  // Where the parent survives a re-raised signal (it is ignored here), fall
  // back to the shell's convention.
  std::optional<int> raised;
  if (line.on_close) {
    std::shared_ptr<fgproxy::child_process> hook;
    fgproxy::conclude_async(
        self.loop(), result.close,
        [&](fgproxy::close_action const& action) {
          raised = action.signal();
          return run_hook(*line.on_close, action, hook);
        });
  } else {
    fgproxy::conclude(self.loop(), result.close,
                      [&](fgproxy::close_action const& action) {
                        raised = action.signal();
                        return fgproxy::close_decision{fgproxy::use_computed{}};
                      });
  }

  self.loop().run();
  return raised ? 128 + *raised : self.exit_code().value_or(0);
}

int run_legacy(command_line const& line) {
  auto& self = fgproxy::current_process::instance();
  auto child = fgproxy::foreground_child(line.command);
  self.loop().run();
  return self.exit_code().value_or(0);
}
}  // namespace

int main(int argc, const char** argv) {
  command_line line;
  try {
    line = parse(argc, argv);
  } catch (const fgproxy::error& err) {
    std::cerr << "fgproxy: " << err.what() << '\n';
    print_usage(std::cerr);
    return 2;
  }
  if (line.help) {
    print_usage(std::cout);
    return 0;
  }

  try {
    return line.legacy ? run_legacy(line) : run_modern(line);
  } catch (const fgproxy::error& err) {
    std::cerr << "fgproxy: " << err.what() << '\n';
    return 127;
  }
}
