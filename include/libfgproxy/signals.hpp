#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fgproxy {
// Termination and interactive signals forwarded from parent to child.
// SIGKILL and SIGSTOP cannot be caught and are never part of the set.
std::vector<int> const& relay_signals();

// "SIGTERM" for SIGTERM; "SIG<n>" for numbers without an abbreviation.
std::string signal_name(int signo);

// Accepts "SIGTERM" or "TERM".
std::optional<int> signal_number(std::string_view name);
}  // namespace fgproxy
