#include <signal.h>
#include <string.h>

#include <libfgproxy/signals.hpp>

std::vector<int> const& fgproxy::relay_signals() {
  static const std::vector<int> signals = {
      SIGABRT, SIGALRM, SIGHUP,  SIGINT,  SIGIO,   SIGPWR,
      SIGQUIT, SIGSTKFLT, SIGSYS, SIGTERM, SIGTRAP, SIGUSR1,
      SIGUSR2, SIGVTALRM, SIGXCPU, SIGXFSZ,
  };
  return signals;
}

std::string fgproxy::signal_name(int signo) {
  if (auto abbrev = sigabbrev_np(signo)) {
    return std::string("SIG") + abbrev;
  }
  return "SIG" + std::to_string(signo);
}

std::optional<int> fgproxy::signal_number(std::string_view name) {
  if (name.substr(0, 3) == "SIG") {
    name.remove_prefix(3);
  }
  if (name.empty()) return std::nullopt;
  for (int signo = 1; signo < NSIG; ++signo) {
    auto abbrev = sigabbrev_np(signo);
    if (abbrev != nullptr and name == abbrev) {
      return signo;
    }
  }
  return std::nullopt;
}
