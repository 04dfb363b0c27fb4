#include <libfgproxy/relay.hpp>
#include <libfgproxy/signals.hpp>
#include <utility>
#include <vector>

fgproxy::relay_handle fgproxy::attach_signals(process_handle& parent,
                                              child_process& child) {
  std::vector<std::pair<int, listener_id>> listeners;
  for (auto signo : relay_signals()) {
    auto id = parent.on_signal(signo, [&child](int sig) { child.kill(sig); });
    listeners.emplace_back(signo, id);
  }

  return relay_handle([&parent, listeners = std::move(listeners)] {
    for (auto [signo, id] : listeners) {
      parent.remove_signal_listener(signo, id);
    }
  });
}

fgproxy::relay_handle fgproxy::attach_streams(process_handle& parent,
                                              child_process& child) {
  auto child_out = child.out();
  auto child_err = child.err();
  auto child_in = child.in();

  if (child_out) child_out->pipe(parent.out());
  if (child_err) child_err->pipe(parent.err());
  if (child_in) parent.in().pipe(*child_in);

  return relay_handle([&parent, child_out, child_err, child_in] {
    if (child_out) child_out->unpipe(parent.out());
    if (child_err) child_err->unpipe(parent.err());
    if (child_in) parent.in().unpipe(*child_in);
  });
}

fgproxy::relay_handle fgproxy::attach_messages(process_handle& parent,
                                               child_process& child) {
  if (!parent.can_send()) {
    return relay_handle();
  }

  auto from_child = child.on_message(
      [&parent](ipc_message const& message) { parent.send(message); });
  auto from_parent = parent.on_message(
      [&child](ipc_message const& message) { child.send(message); });

  return relay_handle([&parent, &child, from_child, from_parent] {
    child.remove_message_listener(from_child);
    parent.remove_message_listener(from_parent);
  });
}
