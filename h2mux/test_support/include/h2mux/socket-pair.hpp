#pragma once

#include <array>
#include <chrono>

#include "h2mux/transport.hpp"

namespace h2mux::test {

// Connected AF_UNIX stream sockets, each end wrapped in a PlainTransport.
// Reads on the server end time out after 'serverReadTimeout' (reported as a transport error) so that a test waiting
// for a frame that never comes fails instead of hanging.
class SocketPair {
 public:
  explicit SocketPair(std::chrono::milliseconds serverReadTimeout = std::chrono::seconds{5});

  PlainTransport& client() noexcept { return _client; }

  PlainTransport& server() noexcept { return _server; }

 private:
  explicit SocketPair(std::array<int, 2> fds) noexcept;

  static std::array<int, 2> Create();

  PlainTransport _client;
  PlainTransport _server;
};

}  // namespace h2mux::test
