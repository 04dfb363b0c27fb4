#include <fcntl.h>
#include <unistd.h>

#include <libfgproxy/error.hpp>
#include <libfgproxy/pipe.hpp>
#include <utility>

fgproxy::pipe::pipe(bool close_on_exec) {
  if (pipe2(fds_, close_on_exec ? O_CLOEXEC : 0) < 0) {
    error::send_errno("pipe creation failed");
  }
}

fgproxy::pipe::~pipe() {
  close_read();
  close_write();
}

int fgproxy::pipe::release_read() { return std::exchange(fds_[read_fd], -1); }
int fgproxy::pipe::release_write() {
  return std::exchange(fds_[write_fd], -1);
}

void fgproxy::pipe::close_read() {
  if (fds_[read_fd] != -1) {
    close(fds_[read_fd]);
    fds_[read_fd] = -1;
  }
}
void fgproxy::pipe::close_write() {
  if (fds_[write_fd] != -1) {
    close(fds_[write_fd]);
    fds_[write_fd] = -1;
  }
}

void fgproxy::pipe::lift(int floor) {
  for (auto& fd : fds_) {
    if (fd == -1 or fd >= floor) continue;
    auto moved = fcntl(fd, F_DUPFD_CLOEXEC, floor);
    if (moved < 0) {
      error::send_errno("could not move pipe descriptor");
    }
    close(fd);
    fd = moved;
  }
}

std::vector<std::byte> fgproxy::pipe::read() {
  char buf[1024];
  ssize_t chars_read;

  while ((chars_read = ::read(fds_[read_fd], buf, sizeof(buf))) < 0) {
    if (errno != EINTR) {
      error::send_errno("could not read from pipe");
    }
  }
  auto bytes = reinterpret_cast<std::byte*>(buf);
  return std::vector<std::byte>(bytes, bytes + chars_read);
}
