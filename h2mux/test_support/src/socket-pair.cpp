#include "h2mux/socket-pair.hpp"

#include <sys/socket.h>
#include <sys/time.h>

#include <array>
#include <chrono>

#include "h2mux/base-fd.hpp"
#include "h2mux/errno-throw.hpp"
#include "h2mux/transport.hpp"

namespace h2mux::test {

std::array<int, 2> SocketPair::Create() {
  std::array<int, 2> fds{};
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds.data()) == -1) {
    throw_errno("socketpair");
  }
  return fds;
}

SocketPair::SocketPair(std::array<int, 2> fds) noexcept : _client(BaseFd(fds[0])), _server(BaseFd(fds[1])) {}

SocketPair::SocketPair(std::chrono::milliseconds serverReadTimeout) : SocketPair(Create()) {
  const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(serverReadTimeout).count();
  struct timeval tv{static_cast<time_t>(usec / 1000000), static_cast<suseconds_t>(usec % 1000000)};
  if (::setsockopt(_server.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1) {
    throw_errno("setsockopt(SO_RCVTIMEO)");
  }
}

}  // namespace h2mux::test
