#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <libfgproxy/error.hpp>
#include <libfgproxy/ipc.hpp>
#include <vector>

std::pair<fgproxy::file_descriptor, fgproxy::file_descriptor>
fgproxy::ipc_channel::socket_pair() {
  int fds[2];
  if (socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, fds) < 0) {
    error::send_errno("could not create ipc socket pair");
  }
  return {file_descriptor(fds[0]), file_descriptor(fds[1])};
}

fgproxy::ipc_channel::ipc_channel(event_loop& loop, file_descriptor socket)
    : loop_(&loop), socket_(std::move(socket)) {}

fgproxy::ipc_channel::~ipc_channel() { disconnect(); }

bool fgproxy::ipc_channel::send(ipc_message const& message) {
  if (!connected()) return false;
  if (message.payload.size() > max_payload) {
    error::send("ipc message of " + std::to_string(message.payload.size()) +
                " bytes exceeds the channel limit");
  }
  // A bare empty record reads as end of stream on the other side.
  if (message.payload.empty() and !message.handle) {
    error::send("cannot send an empty ipc message");
  }

  iovec iov{};
  iov.iov_base = const_cast<char*>(message.payload.data());
  iov.iov_len = message.payload.size();

  msghdr header{};
  header.msg_iov = &iov;
  header.msg_iovlen = 1;

  alignas(cmsghdr) char control[CMSG_SPACE(sizeof(int))];
  if (message.handle) {
    std::memset(control, 0, sizeof(control));
    header.msg_control = control;
    header.msg_controllen = sizeof(control);
    auto cmsg = CMSG_FIRSTHDR(&header);
    cmsg->cmsg_level = SOL_SOCKET;
    cmsg->cmsg_type = SCM_RIGHTS;
    cmsg->cmsg_len = CMSG_LEN(sizeof(int));
    int fd = message.handle.get();
    std::memcpy(CMSG_DATA(cmsg), &fd, sizeof(fd));
  }

  while (sendmsg(socket_.get(), &header, MSG_NOSIGNAL) < 0) {
    if (errno == EINTR) continue;
    if (errno == EPIPE or errno == ECONNRESET or errno == ENOTCONN) {
      disconnect();
      return false;
    }
    error::send_errno("could not send ipc message");
  }
  return true;
}

fgproxy::listener_id fgproxy::ipc_channel::on_message(message_listener fn) {
  auto id = messages_.add(std::move(fn));
  update_watch();
  return id;
}

void fgproxy::ipc_channel::remove_message_listener(listener_id id) {
  messages_.remove(id);
  update_watch();
}

void fgproxy::ipc_channel::remove_all_message_listeners() {
  messages_.clear();
  update_watch();
}

void fgproxy::ipc_channel::drain() {
  while (connected() and receive()) {
  }
}

void fgproxy::ipc_channel::disconnect() {
  if (watch_) {
    loop_->unwatch(*watch_);
    watch_.reset();
  }
  socket_.reset();
}

// Only read while somebody listens, so an idle channel never keeps the loop
// alive.
void fgproxy::ipc_channel::update_watch() {
  if (connected() and !messages_.empty()) {
    if (!watch_) {
      watch_ = loop_->watch(socket_.get(), [this] { receive(); });
    }
  } else if (watch_) {
    loop_->unwatch(*watch_);
    watch_.reset();
  }
}

bool fgproxy::ipc_channel::receive() {
  std::vector<char> buf(max_payload);
  iovec iov{};
  iov.iov_base = buf.data();
  iov.iov_len = buf.size();

  alignas(cmsghdr) char control[CMSG_SPACE(sizeof(int) * 4)];
  msghdr header{};
  header.msg_iov = &iov;
  header.msg_iovlen = 1;
  header.msg_control = control;
  header.msg_controllen = sizeof(control);

  ssize_t got;
  while ((got = recvmsg(socket_.get(), &header,
                        MSG_DONTWAIT | MSG_CMSG_CLOEXEC)) < 0) {
    if (errno == EINTR) continue;
    if (errno == EAGAIN) return false;
    if (errno == ECONNRESET) {
      disconnect();
      return false;
    }
    error::send_errno("could not receive ipc message");
  }

  ipc_message message;
  for (auto cmsg = CMSG_FIRSTHDR(&header); cmsg != nullptr;
       cmsg = CMSG_NXTHDR(&header, cmsg)) {
    if (cmsg->cmsg_level != SOL_SOCKET or cmsg->cmsg_type != SCM_RIGHTS) {
      continue;
    }
    auto count = (cmsg->cmsg_len - CMSG_LEN(0)) / sizeof(int);
    for (std::size_t i = 0; i < count; ++i) {
      int fd;
      std::memcpy(&fd, CMSG_DATA(cmsg) + i * sizeof(int), sizeof(fd));
      // A message carries one handle; close anything extra.
      if (!message.handle) {
        message.handle.reset(fd);
      } else {
        close(fd);
      }
    }
  }

  if (got == 0 and !message.handle) {
    disconnect();
    return false;
  }
  if (header.msg_flags & (MSG_TRUNC | MSG_CTRUNC)) {
    error::send("received a truncated ipc message");
  }

  message.payload.assign(buf.data(), static_cast<std::size_t>(got));
  messages_.emit(message);
  return true;
}
