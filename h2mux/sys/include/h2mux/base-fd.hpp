#pragma once

#include <utility>

namespace h2mux {

// Owning handle of a socket file descriptor. Closes it on destruction.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  BaseFd() noexcept = default;

  explicit BaseFd(int fd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  ~BaseFd() { reset(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Gives up ownership without closing.
  [[nodiscard]] int release() noexcept { return std::exchange(_fd, kClosedFd); }

  // Closes the currently owned descriptor (if any) and takes ownership of newFd.
  void reset(int newFd = kClosedFd) noexcept;

  void close() noexcept { reset(); }

 private:
  int _fd{kClosedFd};
};

}  // namespace h2mux
