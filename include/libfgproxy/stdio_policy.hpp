#pragma once

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace fgproxy {
enum class stdio_mode {
  pipe,
  inherit,
  ignore,
  ipc,
};

// One mode for descriptors 0, 1 and 2, or one mode per descriptor.
using stdio_config = std::variant<stdio_mode, std::vector<stdio_mode>>;

// Child stdio for a parent that may need to relay IPC messages. Absent means
// inherit; with_ipc guarantees exactly one ipc slot.
stdio_config stdio_for(std::optional<stdio_config> const& base, bool with_ipc);

// Per-descriptor form of a configuration; a single mode covers 0..2 and a
// short list is padded with pipe up to three entries.
std::vector<stdio_mode> expand_stdio(stdio_config const& config);

std::optional<stdio_mode> parse_stdio_mode(std::string_view text);
}  // namespace fgproxy
