#include <algorithm>
#include <libfgproxy/stdio_policy.hpp>

fgproxy::stdio_config fgproxy::stdio_for(
    std::optional<stdio_config> const& base, bool with_ipc) {
  stdio_config config = base.value_or(stdio_mode::inherit);
  if (!with_ipc) {
    return config;
  }

  if (auto mode = std::get_if<stdio_mode>(&config)) {
    return std::vector<stdio_mode>{*mode, *mode, *mode, stdio_mode::ipc};
  }

  auto modes = std::get<std::vector<stdio_mode>>(config);
  if (std::find(modes.begin(), modes.end(), stdio_mode::ipc) == modes.end()) {
    // The channel lives past the standard descriptors.
    while (modes.size() < 3) {
      modes.push_back(stdio_mode::pipe);
    }
    modes.push_back(stdio_mode::ipc);
  }
  return modes;
}

std::vector<fgproxy::stdio_mode> fgproxy::expand_stdio(
    stdio_config const& config) {
  if (auto mode = std::get_if<stdio_mode>(&config)) {
    return {*mode, *mode, *mode};
  }
  auto modes = std::get<std::vector<stdio_mode>>(config);
  while (modes.size() < 3) {
    modes.push_back(stdio_mode::pipe);
  }
  return modes;
}

std::optional<fgproxy::stdio_mode> fgproxy::parse_stdio_mode(
    std::string_view text) {
  if (text == "pipe") return stdio_mode::pipe;
  if (text == "inherit") return stdio_mode::inherit;
  if (text == "ignore") return stdio_mode::ignore;
  if (text == "ipc") return stdio_mode::ipc;
  return std::nullopt;
}
