#pragma once

#include <cstddef>
#include <functional>
#include <libfgproxy/event.hpp>
#include <libfgproxy/event_loop.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace fgproxy {
class writable_stream {
 public:
  virtual ~writable_stream() = default;

  // Returns false when the data had to be buffered. A well-behaved source
  // holds further writes back until the drain listeners run.
  virtual bool write(std::byte const* data, std::size_t size) = 0;
  // Called once by a piped readable that reached end of file.
  virtual void end() {}

  listener_id on_drain(std::function<void()> fn) {
    return drain_.add(std::move(fn));
  }
  void remove_drain_listener(listener_id id) { drain_.remove(id); }

 protected:
  void emit_drain() { drain_.emit(); }

 private:
  event<> drain_;
};

class readable_stream {
 public:
  virtual ~readable_stream() = default;

  // Piping the same destination twice has no further effect. A destination
  // must be unpiped before it is destroyed.
  virtual void pipe(writable_stream& destination) = 0;
  virtual void unpipe(writable_stream& destination) = 0;
  virtual std::size_t pipe_count() const = 0;
};

class fd_writable : public writable_stream {
 public:
  // An owned descriptor is closed by end() or on destruction. With a loop, a
  // write the descriptor cannot take right away (EAGAIN) is buffered and
  // flushed once the descriptor becomes writable; without one the descriptor
  // must be blocking.
  fd_writable(int fd, bool owned, event_loop* loop = nullptr)
      : loop_(loop), fd_(fd), owned_(owned) {}
  ~fd_writable() override;

  fd_writable(const fd_writable&) = delete;
  fd_writable& operator=(const fd_writable&) = delete;

  bool write(std::byte const* data, std::size_t size) override;
  // Closes once the buffered data went out.
  void end() override;

  int fd() const { return fd_; }
  // True once the reader went away (EPIPE) or an owned stream was ended.
  bool closed() const { return closed_; }
  std::size_t buffered() const { return pending_.size(); }

 private:
  std::size_t write_some(std::byte const* data, std::size_t size);
  void flush();
  void stop_watching();
  void close_now();

  event_loop* loop_;
  int fd_;
  bool owned_;
  bool closed_ = false;
  bool ending_ = false;
  std::vector<std::byte> pending_;
  std::optional<event_loop::handle> watch_;
};

class fd_readable : public readable_stream {
 public:
  // A flowing stream reads for its whole life and drops data nobody is piped
  // to; otherwise it only reads while at least one destination is attached.
  // Reading pauses while any destination is waiting to drain.
  fd_readable(event_loop& loop, int fd, bool owned, bool flowing);
  ~fd_readable() override;

  fd_readable(const fd_readable&) = delete;
  fd_readable& operator=(const fd_readable&) = delete;

  void pipe(writable_stream& destination) override;
  void unpipe(writable_stream& destination) override;
  std::size_t pipe_count() const override { return destinations_.size(); }

  int fd() const { return fd_; }
  bool ended() const { return ended_; }
  bool paused() const { return !waiting_.empty(); }
  listener_id on_end(std::function<void()> fn) { return end_.add(std::move(fn)); }
  void remove_end_listener(listener_id id) { end_.remove(id); }

 private:
  bool wanted() const { return flowing_ or !destinations_.empty(); }
  void start();
  void stop();
  void read_chunk();
  void schedule_pump();
  void wait_for(writable_stream& destination);
  void drained(writable_stream* destination);

  event_loop* loop_;
  int fd_;
  bool owned_;
  bool flowing_;
  bool ended_ = false;
  std::optional<event_loop::handle> watch_;
  std::optional<event_loop::handle> pump_;
  std::vector<writable_stream*> destinations_;
  // Destinations that refused a write, with their drain subscription.
  std::vector<std::pair<writable_stream*, listener_id>> waiting_;
  event<> end_;
};
}  // namespace fgproxy
