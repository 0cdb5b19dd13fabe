#pragma once

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <limits>

#include <poll.h>
#include <unistd.h>

namespace gdbhub::posix {

// Owns one file descriptor: pipe ends, sockets.
class fd_handle {
public:
  fd_handle() = default;
  explicit fd_handle(int fd) : fd_(fd) {}

  fd_handle(fd_handle&& other) noexcept : fd_(other.release()) {}
  fd_handle& operator=(fd_handle&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  fd_handle(const fd_handle&) = delete;
  fd_handle& operator=(const fd_handle&) = delete;

  ~fd_handle() { close(); }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  explicit operator bool() const { return valid(); }

  int release() {
    int current = fd_;
    fd_ = -1;
    return current;
  }

  void reset(int fd = -1) {
    close();
    fd_ = fd;
  }

  void close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
};

enum class wait_result { ready, timeout, interrupted, failed };

// Hangup and error count as ready: the following read reports them.
inline wait_result wait_readable(int fd, std::chrono::milliseconds timeout) {
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLIN;
  auto ms = std::clamp<std::chrono::milliseconds::rep>(timeout.count(), 0, std::numeric_limits<int>::max());
  int result = ::poll(&pfd, 1, static_cast<int>(ms));
  if (result > 0) {
    return wait_result::ready;
  }
  if (result == 0) {
    return wait_result::timeout;
  }
  return errno == EINTR ? wait_result::interrupted : wait_result::failed;
}

} // namespace gdbhub::posix
