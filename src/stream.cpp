#include <unistd.h>

#include <algorithm>
#include <array>
#include <libfgproxy/error.hpp>
#include <libfgproxy/stream.hpp>

fgproxy::fd_writable::~fd_writable() {
  stop_watching();
  if (owned_ and fd_ != -1) {
    close(fd_);
  }
}

bool fgproxy::fd_writable::write(std::byte const* data, std::size_t size) {
  // Nobody reads any more; dropping the data keeps sources moving.
  if (closed_ or ending_) return true;
  if (!pending_.empty()) {
    pending_.insert(pending_.end(), data, data + size);
    return false;
  }

  auto done = write_some(data, size);
  if (done == size or closed_) return true;

  pending_.assign(data + done, data + size);
  watch_ = loop_->watch_writable(fd_, [this] { flush(); });
  return false;
}

std::size_t fgproxy::fd_writable::write_some(std::byte const* data,
                                             std::size_t size) {
  std::size_t done = 0;
  while (done < size) {
    auto written = ::write(fd_, data + done, size - done);
    if (written < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN and loop_ != nullptr) break;
      if (errno == EPIPE) {
        closed_ = true;
        break;
      }
      error::send_errno("could not write to stream");
    }
    done += static_cast<std::size_t>(written);
  }
  return done;
}

void fgproxy::fd_writable::flush() {
  auto done = write_some(pending_.data(), pending_.size());
  pending_.erase(pending_.begin(), pending_.begin() + done);
  if (!pending_.empty() and !closed_) return;

  pending_.clear();
  stop_watching();
  if (ending_) {
    close_now();
  }
  emit_drain();
}

void fgproxy::fd_writable::stop_watching() {
  if (watch_) {
    loop_->unwatch(*watch_);
    watch_.reset();
  }
}

void fgproxy::fd_writable::end() {
  // Borrowed descriptors (the parent's standard streams) stay open.
  if (!owned_ or ending_) return;
  if (!pending_.empty() and !closed_) {
    ending_ = true;
    return;
  }
  close_now();
}

void fgproxy::fd_writable::close_now() {
  stop_watching();
  closed_ = true;
  if (owned_ and fd_ != -1) {
    close(fd_);
    fd_ = -1;
  }
}

fgproxy::fd_readable::fd_readable(event_loop& loop, int fd, bool owned,
                                  bool flowing)
    : loop_(&loop), fd_(fd), owned_(owned), flowing_(flowing) {
  if (flowing_) {
    start();
  }
}

fgproxy::fd_readable::~fd_readable() {
  stop();
  for (auto [destination, id] : waiting_) {
    destination->remove_drain_listener(id);
  }
  if (owned_) {
    close(fd_);
  }
}

void fgproxy::fd_readable::pipe(writable_stream& destination) {
  if (std::find(destinations_.begin(), destinations_.end(), &destination) !=
      destinations_.end()) {
    return;
  }
  destinations_.push_back(&destination);
  start();
}

void fgproxy::fd_readable::unpipe(writable_stream& destination) {
  auto it = std::find(destinations_.begin(), destinations_.end(), &destination);
  if (it == destinations_.end()) return;
  destinations_.erase(it);

  auto waiting = std::find_if(waiting_.begin(), waiting_.end(),
                              [&](auto const& entry) {
                                return entry.first == &destination;
                              });
  if (waiting != waiting_.end()) {
    destination.remove_drain_listener(waiting->second);
    waiting_.erase(waiting);
  }

  if (!wanted()) {
    stop();
  } else {
    start();
  }
}

void fgproxy::fd_readable::start() {
  if (ended_ or watch_ or pump_ or paused()) return;
  watch_ = loop_->watch_if_pollable(fd_, [this] { read_chunk(); });
  if (!watch_) {
    // Regular files are always readable; read them a chunk per tick.
    schedule_pump();
  }
}

void fgproxy::fd_readable::stop() {
  if (watch_) {
    loop_->unwatch(*watch_);
    watch_.reset();
  }
  if (pump_) {
    loop_->cancel_timer(*pump_);
    pump_.reset();
  }
}

void fgproxy::fd_readable::schedule_pump() {
  using namespace std::chrono_literals;
  pump_ = loop_->add_timer(0ms, [this] {
    pump_.reset();
    read_chunk();
    if (!ended_ and !watch_ and !paused() and wanted()) {
      schedule_pump();
    }
  });
}

void fgproxy::fd_readable::wait_for(writable_stream& destination) {
  for (auto const& entry : waiting_) {
    if (entry.first == &destination) return;
  }
  auto id = destination.on_drain([this, target = &destination] {
    drained(target);
  });
  waiting_.emplace_back(&destination, id);
}

void fgproxy::fd_readable::drained(writable_stream* destination) {
  auto it = std::find_if(waiting_.begin(), waiting_.end(),
                         [&](auto const& entry) {
                           return entry.first == destination;
                         });
  if (it == waiting_.end()) return;
  destination->remove_drain_listener(it->second);
  waiting_.erase(it);
  if (wanted()) {
    start();
  }
}

void fgproxy::fd_readable::read_chunk() {
  std::array<std::byte, 65536> buf;
  ssize_t got;
  while ((got = ::read(fd_, buf.data(), buf.size())) < 0 and errno == EINTR) {
  }

  if (got < 0 and errno == EAGAIN) return;
  if (got < 0 and errno != EIO) {
    error::send_errno("could not read from stream");
  }

  if (got > 0) {
    auto destinations = destinations_;
    for (auto destination : destinations) {
      if (!destination->write(buf.data(), static_cast<std::size_t>(got))) {
        wait_for(*destination);
      }
    }
    if (paused()) {
      stop();
    }
    return;
  }

  // End of file, or EIO from a terminal that went away.
  ended_ = true;
  stop();
  auto destinations = destinations_;
  for (auto destination : destinations) {
    destination->end();
  }
  end_.emit();
}
