#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "h2mux/header-codec.hpp"
#include "h2mux/http2-frame-types.hpp"
#include "h2mux/http2-frame.hpp"
#include "h2mux/http2-framer.hpp"
#include "h2mux/literal-header-codec.hpp"
#include "h2mux/transport.hpp"

namespace h2mux::test {

// Scripted server end of an HTTP/2 connection, driven synchronously by a test.
// Frames are read in owning mode so that they stay valid after the next read. Header blocks use LiteralHeaderCodec.
// Transport failures (including the read timeout of SocketPair) propagate as http2::TransportError.
class FakePeer {
 public:
  explicit FakePeer(ITransport& transport);

  // Reads the client preface and the client SETTINGS, then sends 'serverSettings' and acknowledges the client's.
  // Throws std::runtime_error if the client does not start with the preface followed by SETTINGS.
  void handshake(std::span<const http2::SettingsEntry> serverSettings = {});

  // Settings received from the client during handshake().
  [[nodiscard]] const std::vector<http2::SettingsEntry>& clientSettings() const noexcept { return _clientSettings; }

  [[nodiscard]] http2::Frame readFrame() { return _framer.readFrame(); }

  // Reads frames until one of the given type, discarding the others.
  http2::Frame expectFrame(http2::FrameType type);

  // Decodes the header block of a HEADERS frame carrying END_HEADERS.
  http2::HeaderList decodeHeaders(const http2::Frame& headersFrame);

  // Writes a single HEADERS frame with END_HEADERS.
  void writeHeaders(uint32_t streamId, std::span<const http2::HeaderField> headers, bool endStream);

  http2::Framer& framer() noexcept { return _framer; }

 private:
  ITransport& _transport;
  http2::Framer _framer;
  LiteralHeaderCodec _codec;
  std::vector<http2::SettingsEntry> _clientSettings;
};

}  // namespace h2mux::test
