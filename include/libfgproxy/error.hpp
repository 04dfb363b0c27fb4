#pragma once

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace fgproxy {
class error : public std::runtime_error {
 public:
  [[noreturn]] static void send(std::string const& what) { throw error(what); }
  [[noreturn]] static void send_errno(std::string const& prefix) {
    throw error(prefix + ": " + std::strerror(errno));
  }

 private:
  explicit error(std::string const& what) : std::runtime_error(what) {}
};
}  // namespace fgproxy
