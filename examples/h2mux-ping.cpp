#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>

#include "h2mux/byte-buffer.hpp"
#include "h2mux/client-connection.hpp"
#include "h2mux/header-codec.hpp"
#include "h2mux/http2-frame-types.hpp"
#include "h2mux/log.hpp"
#include "h2mux/tcp-connector.hpp"
#include "h2mux/transport.hpp"

using namespace h2mux;

namespace {

// This program never opens a stream, so it never has a header block to encode or decode.
class NoHeadersCodec : public http2::HeaderBlockCodec {
 public:
  void encode(std::span<const http2::HeaderField>, ByteBuffer&) override {
    throw std::logic_error("h2mux-ping does not send headers");
  }

  std::optional<http2::HeaderList> decode(std::span<const std::byte>) override { return std::nullopt; }

  void setMaxEncoderTableSize(uint32_t) override {}
};

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <host> <port> [count]\n";
    return EXIT_FAILURE;
  }
  int count = 3;
  if (argc > 3) {
    const auto [ptr, errc] = std::from_chars(argv[3], argv[3] + std::strlen(argv[3]), count);
    if (errc != std::errc{} || ptr != argv[3] + std::strlen(argv[3]) || count <= 0) {
      std::cerr << "Invalid count: " << argv[3] << "\n";
      return EXIT_FAILURE;
    }
  }

  try {
    PlainTransport transport(ConnectTCP(argv[1], argv[2]));
    NoHeadersCodec codec;
    http2::ClientConnection connection(transport, codec);
    connection.setOnGoAway([](uint32_t lastStreamId, http2::ErrorCode errorCode, std::string_view debugData) {
      log::warn("peer sent GOAWAY last stream {} code {} '{}'", lastStreamId, http2::ErrorCodeName(errorCode),
                debugData);
    });
    connection.start();

    for (int pingIdx = 0; pingIdx < count; ++pingIdx) {
      const auto rtt = connection.ping();
      if (pingIdx == 0) {
        // The server SETTINGS precede its first PING ACK.
        const auto settings = connection.peerSettings();
        log::info("peer settings: max concurrent streams {} initial window {} max frame size {} header table {}",
                  settings.maxConcurrentStreams, settings.initialWindowSize, settings.maxFrameSize,
                  settings.headerTableSize);
      }
      log::info("ping {}: rtt {} us", pingIdx + 1,
                std::chrono::duration_cast<std::chrono::microseconds>(rtt).count());
    }

    connection.shutdown(http2::ErrorCode::NoError, "bye");
    connection.close();
  } catch (const std::exception& e) {
    log::error("h2mux-ping failed: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
