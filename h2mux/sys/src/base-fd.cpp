#include "h2mux/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "h2mux/log.hpp"

namespace h2mux {

void BaseFd::reset(int newFd) noexcept {
  const int oldFd = std::exchange(_fd, newFd);
  if (oldFd == kClosedFd || oldFd == newFd) {
    return;
  }
  // On Linux the descriptor is released even when close fails with EINTR, so no retry.
  if (::close(oldFd) != 0) {
    log::warn("close of fd # {} failed: {}", oldFd, std::strerror(errno));
    return;
  }
  log::trace("fd # {} closed", oldFd);
}

}  // namespace h2mux
