#pragma once

#include <functional>
#include <libfgproxy/child_process.hpp>
#include <libfgproxy/process_handle.hpp>

namespace fgproxy {
// A reversible subscription. detach() undoes the attach exactly once; later
// calls, and destruction of a detached or default-constructed handle, do
// nothing.
class relay_handle {
 public:
  relay_handle() = default;
  explicit relay_handle(std::function<void()> detach)
      : detach_(std::move(detach)) {}
  ~relay_handle() { detach(); }

  relay_handle(const relay_handle&) = delete;
  relay_handle& operator=(const relay_handle&) = delete;
  relay_handle(relay_handle&& other) noexcept
      : detach_(std::move(other.detach_)) {
    other.detach_ = nullptr;
  }
  relay_handle& operator=(relay_handle&& other) noexcept {
    if (this != &other) {
      detach();
      detach_ = std::move(other.detach_);
      other.detach_ = nullptr;
    }
    return *this;
  }

  void detach() {
    if (auto fn = std::move(detach_)) {
      detach_ = nullptr;
      fn();
    }
  }
  bool attached() const { return static_cast<bool>(detach_); }

 private:
  std::function<void()> detach_;
};

// Forwards every relay_signals() signal the parent receives to the child.
relay_handle attach_signals(process_handle& parent, child_process& child);

// child out/err -> parent out/err and parent in -> child in, for each child
// stream that exists.
relay_handle attach_streams(process_handle& parent, child_process& child);

// Forwards IPC messages both ways. Inert when the parent cannot send.
relay_handle attach_messages(process_handle& parent, child_process& child);
}  // namespace fgproxy
