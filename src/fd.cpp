#include <fcntl.h>
#include <unistd.h>

#include <libfgproxy/error.hpp>
#include <libfgproxy/fd.hpp>

void fgproxy::file_descriptor::reset(int fd) {
  if (fd_ != -1) {
    close(fd_);
  }
  fd_ = fd;
}

fgproxy::file_descriptor fgproxy::file_descriptor::duplicate() const {
  int copy = fcntl(fd_, F_DUPFD_CLOEXEC, 0);
  if (copy < 0) {
    error::send_errno("could not duplicate descriptor");
  }
  return file_descriptor(copy);
}
