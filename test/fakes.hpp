#pragma once

#include <algorithm>
#include <chrono>
#include <libfgproxy/child_process.hpp>
#include <libfgproxy/event.hpp>
#include <libfgproxy/process_handle.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

// In-memory stand-ins for the parent and child processes.
namespace fakes {
class sink : public fgproxy::writable_stream {
 public:
  bool write(std::byte const* data, std::size_t size) override {
    text.append(reinterpret_cast<char const*>(data), size);
    return !full;
  }
  void end() override { ++ends; }

  // Stops refusing writes and tells the sources.
  void drain() {
    full = false;
    emit_drain();
  }

  std::string text;
  int ends = 0;
  bool full = false;
};

class source : public fgproxy::readable_stream {
 public:
  void pipe(fgproxy::writable_stream& destination) override {
    if (std::find(destinations.begin(), destinations.end(), &destination) ==
        destinations.end()) {
      destinations.push_back(&destination);
    }
  }
  void unpipe(fgproxy::writable_stream& destination) override {
    destinations.erase(
        std::remove(destinations.begin(), destinations.end(), &destination),
        destinations.end());
  }
  std::size_t pipe_count() const override { return destinations.size(); }

  void push(std::string const& text) {
    for (auto destination : destinations) {
      destination->write(reinterpret_cast<std::byte const*>(text.data()),
                         text.size());
    }
  }
  void finish() {
    for (auto destination : destinations) {
      destination->end();
    }
  }

  std::vector<fgproxy::writable_stream*> destinations;
};

struct sent_message {
  std::string payload;
  bool had_handle;
};

class parent : public fgproxy::process_handle {
 public:
  explicit parent(bool with_ipc = false) : with_ipc_(with_ipc) {}

  pid_t pid() const override { return 4242; }
  fgproxy::writable_stream& out() override { return out_; }
  fgproxy::writable_stream& err() override { return err_; }
  fgproxy::readable_stream& in() override { return in_; }

  fgproxy::listener_id on_signal(int signo, signal_listener fn) override {
    return signals_[signo].add(std::move(fn));
  }
  void remove_signal_listener(int signo, fgproxy::listener_id id) override {
    signals_[signo].remove(id);
  }

  fgproxy::listener_id on_exit(exit_listener fn) override {
    return exit_.add(std::move(fn));
  }
  void remove_exit_listener(fgproxy::listener_id id) override {
    exit_.remove(id);
  }

  bool can_send() const override { return with_ipc_; }
  void send(fgproxy::ipc_message const& message) override {
    if (with_ipc_) {
      sent.push_back({message.payload, message.handle.valid()});
    }
  }
  fgproxy::listener_id on_message(message_listener fn) override {
    return messages_.add(std::move(fn));
  }
  void remove_message_listener(fgproxy::listener_id id) override {
    messages_.remove(id);
  }
  void remove_all_message_listeners() override { messages_.clear(); }

  void exit(int code) override { exits.push_back(code); }
  void kill(pid_t pid, int signo) override { kills.emplace_back(pid, signo); }

  std::optional<int> exit_code() const override { return exit_code_; }
  void set_exit_code(int code) override { exit_code_ = code; }

  bool is_current_process() const override { return pretend_current; }
  void keep_alive(std::chrono::milliseconds duration) override {
    keep_alives.push_back(duration);
  }

  // Test controls.
  void raise(int signo) { signals_[signo].emit(signo); }
  void deliver(fgproxy::ipc_message const& message) { messages_.emit(message); }
  void exiting(int code) { exit_.emit(code); }

  std::size_t signal_listener_count() const {
    std::size_t count = 0;
    for (auto const& [signo, listeners] : signals_) {
      count += listeners.size();
    }
    return count;
  }
  std::size_t message_listener_count() const { return messages_.size(); }
  std::size_t exit_listener_count() const { return exit_.size(); }

  sink out_;
  sink err_;
  source in_;
  std::vector<int> exits;
  std::vector<std::pair<pid_t, int>> kills;
  std::vector<sent_message> sent;
  std::vector<std::chrono::milliseconds> keep_alives;
  bool pretend_current = false;

 private:
  bool with_ipc_;
  std::map<int, fgproxy::event<int>> signals_;
  fgproxy::event<fgproxy::ipc_message const&> messages_;
  fgproxy::event<int> exit_;
  std::optional<int> exit_code_;
};

class child : public fgproxy::child_process {
 public:
  explicit child(bool with_streams = false) : with_streams_(with_streams) {}

  pid_t pid() const override { return 5151; }
  fgproxy::readable_stream* out() override {
    return with_streams_ ? &out_ : nullptr;
  }
  fgproxy::readable_stream* err() override {
    return with_streams_ ? &err_ : nullptr;
  }
  fgproxy::writable_stream* in() override {
    return with_streams_ ? &in_ : nullptr;
  }

  fgproxy::listener_id on_close(close_listener fn) override {
    return close_.add(std::move(fn));
  }
  void remove_close_listener(fgproxy::listener_id id) override {
    close_.remove(id);
  }

  bool connected() const override { return !closed_; }
  bool send(fgproxy::ipc_message const& message) override {
    sent.push_back({message.payload, message.handle.valid()});
    return true;
  }
  fgproxy::listener_id on_message(message_listener fn) override {
    return messages_.add(std::move(fn));
  }
  void remove_message_listener(fgproxy::listener_id id) override {
    messages_.remove(id);
  }

  bool kill(int signo) override {
    if (closed_) return false;
    kills.push_back(signo);
    return true;
  }

  // Test controls.
  void close(fgproxy::exit_status const& status) {
    closed_ = true;
    close_.emit(status);
  }
  void message(fgproxy::ipc_message const& message) { messages_.emit(message); }

  std::size_t close_listener_count() const { return close_.size(); }
  std::size_t message_listener_count() const { return messages_.size(); }

  source out_;
  source err_;
  sink in_;
  std::vector<int> kills;
  std::vector<sent_message> sent;

 private:
  bool with_streams_;
  bool closed_ = false;
  fgproxy::event<fgproxy::exit_status const&> close_;
  fgproxy::event<fgproxy::ipc_message const&> messages_;
};
}  // namespace fakes
