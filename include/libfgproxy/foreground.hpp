#pragma once

#include <functional>
#include <future>
#include <libfgproxy/child_process.hpp>
#include <libfgproxy/close_action.hpp>
#include <libfgproxy/process_handle.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fgproxy {
using spawn_function = std::function<std::shared_ptr<child_process>(
    std::string const& file, std::vector<std::string> const& args,
    launch_options const& options)>;

// Unlike plain launch_options, an absent stdio means inherit.
struct spawn_options : launch_options {
  // Process the child stands in for. Defaults to current_process.
  process_handle* parent = nullptr;
  // Defaults to posix_child::launch on the current process loop.
  spawn_function spawn;
  // Guard against the parent being SIGKILLed. Only used when the parent is
  // the current process.
  bool watchdog = true;
};

struct spawn_result {
  std::shared_ptr<child_process> child;
  // Ready once the child closed.
  std::future<close_action> close;
};

using close_handler = std::function<close_decision(close_action const&)>;
using async_close_handler =
    std::function<std::future<close_decision>(close_action const&)>;

// Relays signals, streams and messages from parent to child until the child
// closes, then tears every relay down and computes the close action.
std::future<close_action> proxy(process_handle& parent,
                                std::shared_ptr<child_process> child);

// Spawns a proxied child. Throws error if the child cannot be started.
spawn_result spawn(std::string const& file,
                   std::vector<std::string> const& args = {},
                   spawn_options const& options = {});

// Waits for the close action, runs the handler and applies its decision.
// Whatever the handler throws propagates. Returns true if the parent was asked
// to terminate.
bool conclude(event_loop& loop, std::future<close_action>& close,
              close_handler const& handler = {});
bool conclude_async(event_loop& loop, std::future<close_action>& close,
                    async_close_handler const& handler);
}  // namespace fgproxy
