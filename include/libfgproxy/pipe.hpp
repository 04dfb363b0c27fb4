#pragma once

#include <cstddef>
#include <vector>

namespace fgproxy {
class pipe {
 public:
  static constexpr unsigned read_fd = 0;
  static constexpr unsigned write_fd = 1;

  explicit pipe(bool close_on_exec);
  ~pipe();

  pipe(const pipe&) = delete;
  pipe& operator=(const pipe&) = delete;

  int get_read() const { return fds_[read_fd]; }
  int get_write() const { return fds_[write_fd]; }
  int release_read();
  int release_write();
  void close_read();
  void close_write();

  // Moves both ends to descriptors at or above floor.
  void lift(int floor);

  std::vector<std::byte> read();

 private:
  int fds_[2];
};
}  // namespace fgproxy
