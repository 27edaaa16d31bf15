#include "h2mux/transport.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>

#include "h2mux/log.hpp"

namespace h2mux {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

ITransport::TransportResult PlainTransport::read(std::span<std::byte> buf) {
  while (true) {
    const auto nbRead = ::read(_fd.fd(), buf.data(), buf.size());
    if (nbRead > 0) {
      return {static_cast<std::size_t>(nbRead), TransportStatus::Ok};
    }
    if (nbRead == 0) {
      return {0, TransportStatus::Eof};
    }
    if (errno == EINTR) {
      continue;
    }
    log::debug("read on fd # {} failed: {}", _fd.fd(), std::strerror(errno));
    return {0, TransportStatus::Error};
  }
}

ITransport::TransportResult PlainTransport::write(std::span<const std::byte> data) {
  TransportResult ret{0, TransportStatus::Ok};

  while (ret.bytesProcessed < data.size()) {
    const auto nbWritten =
        ::send(_fd.fd(), data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed, MSG_NOSIGNAL);
    if (nbWritten == -1) [[unlikely]] {
      if (errno == EINTR) {
        // Interrupted by signal, retry immediately
        continue;
      }
      // Fatal error (ECONNRESET, EPIPE, etc.)
      log::debug("write on fd # {} failed: {}", _fd.fd(), std::strerror(errno));
      ret.status = TransportStatus::Error;
      break;
    }

    ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
  }

  return ret;
}

void PlainTransport::shutdown() noexcept {
  if (_fd && ::shutdown(_fd.fd(), SHUT_RDWR) == -1 && errno != ENOTCONN) {
    log::warn("shutdown of fd # {} failed: {}", _fd.fd(), std::strerror(errno));
  }
}

}  // namespace h2mux
