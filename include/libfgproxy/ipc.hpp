#pragma once

#include <cstddef>
#include <functional>
#include <libfgproxy/event.hpp>
#include <libfgproxy/event_loop.hpp>
#include <libfgproxy/fd.hpp>
#include <optional>
#include <string>
#include <utility>

namespace fgproxy {
// Opaque payload plus an optional descriptor (socket, listening socket, ...)
// travelling with it.
struct ipc_message {
  std::string payload;
  file_descriptor handle;
};

// One SOCK_SEQPACKET record per message; the descriptor rides along as
// SCM_RIGHTS ancillary data.
class ipc_channel {
 public:
  using message_listener = std::function<void(ipc_message const&)>;

  static constexpr std::size_t max_payload = 64 * 1024;
  // Environment variable naming the channel descriptor in a child.
  static constexpr char const* fd_variable = "FGPROXY_IPC_FD";

  // Both ends are close-on-exec.
  static std::pair<file_descriptor, file_descriptor> socket_pair();

  ipc_channel(event_loop& loop, file_descriptor socket);
  ~ipc_channel();

  ipc_channel(const ipc_channel&) = delete;
  ipc_channel& operator=(const ipc_channel&) = delete;

  bool connected() const { return socket_.valid(); }

  // Returns false when the peer is gone.
  bool send(ipc_message const& message);

  listener_id on_message(message_listener fn);
  void remove_message_listener(listener_id id);
  void remove_all_message_listeners();
  std::size_t message_listener_count() const { return messages_.size(); }

  // Dispatches every message already queued on the socket.
  void drain();
  void disconnect();

 private:
  // Returns false when nothing was pending.
  bool receive();
  void update_watch();

  event_loop* loop_;
  file_descriptor socket_;
  std::optional<event_loop::handle> watch_;
  event<ipc_message const&> messages_;
};
}  // namespace fgproxy
