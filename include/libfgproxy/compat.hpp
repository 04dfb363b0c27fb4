#pragma once

#include <initializer_list>
#include <libfgproxy/child_process.hpp>
#include <libfgproxy/foreground.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fgproxy {
// The first-generation calling convention, kept for callers that depend on it.
// Always proxies through current_process and inherits stdio (no stream
// relay, no watchdog). When the child closes, the parent's pending exit code
// is set right away (128 + signal number for a signal) and the callback runs
// synchronously with the close action. Without a callback the action is
// invoked as computed.
std::shared_ptr<child_process> foreground_child(
    std::vector<std::string> const& command, close_handler callback = {});
std::shared_ptr<child_process> foreground_child(
    std::string const& program, std::vector<std::string> const& args,
    close_handler callback = {});
std::shared_ptr<child_process> foreground_child(
    std::string const& program, std::initializer_list<std::string> args,
    close_handler callback = {});
// Program without arguments.
std::shared_ptr<child_process> foreground_child(std::string const& program,
                                                close_handler callback = {});
}  // namespace fgproxy
