#include "h2mux/fake-peer.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <stdexcept>
#include <utility>

#include "h2mux/byte-buffer.hpp"
#include "h2mux/header-codec.hpp"
#include "h2mux/http2-errors.hpp"
#include "h2mux/http2-frame-types.hpp"
#include "h2mux/http2-frame.hpp"
#include "h2mux/http2-framer.hpp"
#include "h2mux/transport.hpp"

namespace h2mux::test {

namespace {

http2::FramerOptions PeerOptions() {
  http2::FramerOptions options;
  options.reuseFrames = false;
  return options;
}

}  // namespace

FakePeer::FakePeer(ITransport& transport) : _transport(transport), _framer(transport, PeerOptions()) {}

void FakePeer::handshake(std::span<const http2::SettingsEntry> serverSettings) {
  std::array<std::byte, http2::kClientPreface.size()> preface;
  std::size_t nbRead = 0;
  while (nbRead < preface.size()) {
    const auto [bytes, status] = _transport.read(std::span<std::byte>(preface).subspan(nbRead));
    if (status != TransportStatus::Ok) {
      throw http2::TransportError("unable to read the client preface");
    }
    nbRead += bytes;
  }
  if (AsStringView(preface) != http2::kClientPreface) {
    throw std::runtime_error("invalid client preface");
  }

  const http2::Frame settings = _framer.readFrame();
  if (settings.type() != http2::FrameType::Settings || settings.get<http2::SettingsFrame>().isAck) {
    throw std::runtime_error(std::format("expected client SETTINGS, got {}", http2::SummarizeFrame(settings)));
  }
  _clientSettings.clear();
  settings.get<http2::SettingsFrame>().forEach([this](http2::SettingsEntry entry) { _clientSettings.push_back(entry); });

  _framer.writeSettings(serverSettings);
  _framer.writeSettingsAck();
}

http2::Frame FakePeer::expectFrame(http2::FrameType type) {
  while (true) {
    http2::Frame frame = _framer.readFrame();
    if (frame.type() == type) {
      return frame;
    }
  }
}

http2::HeaderList FakePeer::decodeHeaders(const http2::Frame& headersFrame) {
  auto headers = _codec.decode(headersFrame.get<http2::HeadersFrame>().headerBlockFragment);
  if (!headers) {
    throw std::runtime_error("invalid header block");
  }
  return std::move(*headers);
}

void FakePeer::writeHeaders(uint32_t streamId, std::span<const http2::HeaderField> headers, bool endStream) {
  const ByteBuffer block = LiteralHeaderCodec::Encode(headers);
  http2::HeadersFrameParam param;
  param.streamId = streamId;
  param.headerBlockFragment = block;
  param.endStream = endStream;
  param.endHeaders = true;
  _framer.writeHeaders(param);
}

}  // namespace h2mux::test
