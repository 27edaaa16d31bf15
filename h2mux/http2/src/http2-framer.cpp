#include "h2mux/http2-framer.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include "h2mux/byte-buffer.hpp"
#include "h2mux/header-block-validator.hpp"
#include "h2mux/http2-errors.hpp"
#include "h2mux/http2-frame-types.hpp"
#include "h2mux/http2-frame.hpp"
#include "h2mux/log.hpp"
#include "h2mux/transport.hpp"

namespace h2mux::http2 {

Framer::Framer(ITransport& transport, FramerOptions options)
    : _transport(transport), _options(options), _readGeneration(std::make_shared<uint64_t>(0)) {
  setMaxReadFrameSize(_options.maxReadFrameSize);
}

Framer::~Framer() {
  // Frames still held by callers point into _rbuf which is about to be freed.
  ++*_readGeneration;
}

void Framer::setMaxReadFrameSize(uint32_t maxSize) noexcept {
  _options.maxReadFrameSize = std::min(maxSize, kMaxMaxFrameSize);
}

// ============================
// Read path
// ============================

void Framer::readExact(std::span<std::byte> buf, bool atFrameStart) {
  std::size_t nbRead = 0;
  while (nbRead < buf.size()) {
    const auto [bytes, status] = _transport.read(buf.subspan(nbRead));
    if (status == TransportStatus::Ok) {
      nbRead += bytes;
      continue;
    }
    if (status == TransportStatus::Eof) {
      if (atFrameStart && nbRead == 0) {
        _errorDetail = "EOF";
        throw TransportError(_errorDetail, true);
      }
      _errorDetail = std::format("unexpected EOF after {} of {} bytes", nbRead, buf.size());
    } else {
      _errorDetail = "transport read error";
    }
    throw TransportError(_errorDetail);
  }
}

void Framer::throwConnectionError(ErrorCode code, std::string detail) {
  _errorDetail = std::move(detail);
  throw ConnectionError(code, _errorDetail);
}

Frame Framer::readFrame() {
  _errorDetail.clear();
  ++*_readGeneration;

  std::array<std::byte, FrameHeader::kSize> headerBuf;
  readExact(headerBuf, true);
  const FrameHeader header = ParseFrameHeader(headerBuf);

  if (header.length > _options.maxReadFrameSize) {
    _errorDetail = std::format("{}: length {} exceeds maximum {}", DescribeFrameHeader(header), header.length,
                               _options.maxReadFrameSize);
    throw FrameTooLargeError(_errorDetail);
  }

  // In owning mode each frame gets its own payload storage, shared with the returned Frame.
  std::shared_ptr<ByteBuffer> ownedStorage;
  ByteBuffer* payloadBuf = &_rbuf;
  if (!_options.reuseFrames) {
    ownedStorage = std::make_shared<ByteBuffer>();
    payloadBuf = ownedStorage.get();
  }
  payloadBuf->clear();
  payloadBuf->ensureAvailableCapacity(header.length);
  payloadBuf->setSize(header.length);
  readExact(std::span<std::byte>(payloadBuf->data(), header.length), false);

  FramePayload payload;
  const FrameParseStatus status = ParseFramePayload(header, *payloadBuf, payload);
  if (!status.ok() && status.result != FrameParseResult::StreamError) {
    throwConnectionError(ToErrorCode(status.result), std::string(status.reason));
  }

  if (!_options.allowIllegalReads) {
    const auto verdict = _headerBlockValidator.check(header);
    if (verdict != HeaderBlockValidator::Verdict::Ok) {
      throwConnectionError(ErrorCode::ProtocolError, _headerBlockValidator.describe(verdict, header));
    }
  }

  if (status.result == FrameParseResult::StreamError) {
    _errorDetail = std::string(status.reason);
    throw StreamError(header.streamId, ErrorCode::ProtocolError, _errorDetail);
  }

  Frame frame = _options.reuseFrames ? Frame(header, std::move(payload), _readGeneration, *_readGeneration)
                                     : Frame(header, std::move(payload), std::move(ownedStorage));
  if (_options.logReads) {
    log::debug("http2: Framer {}: read {}", static_cast<const void*>(this), SummarizeFrame(frame));
  }
  return frame;
}

// ============================
// Write path
// ============================

void Framer::checkStreamId(uint32_t streamId) const {
  if (!IsValidStreamId(streamId) && !_options.allowIllegalWrites) {
    throw std::invalid_argument(std::format("invalid stream ID {}", streamId));
  }
}

void Framer::endWrite() {
  const std::size_t payloadSize = _wbuf.size() - FrameHeader::kSize;
  if (payloadSize > kMaxMaxFrameSize) {
    throw FrameTooLargeError(std::format("frame payload of {} bytes does not fit in 24 bits", payloadSize));
  }
  if (_options.logWrites) {
    logWrite();
  }
  const auto [bytes, status] = _transport.write(_wbuf);
  if (status != TransportStatus::Ok || bytes != _wbuf.size()) {
    throw TransportError(std::format("short write: {} of {} bytes", bytes, _wbuf.size()));
  }
}

void Framer::logWrite() const {
  const FrameHeader header = ParseFrameHeader(_wbuf);
  const auto payloadBytes = _wbuf.span().subspan(FrameHeader::kSize);
  FramePayload payload;
  if (ParseFramePayload(header, payloadBytes, payload).ok()) {
    log::debug("http2: Framer {}: wrote {}", static_cast<const void*>(this),
               SummarizeFrame(Frame(header, std::move(payload), nullptr, 0)));
  } else {
    log::debug("http2: Framer {}: wrote illegal {}", static_cast<const void*>(this), DescribeFrameHeader(header));
  }
}

void Framer::writeData(uint32_t streamId, bool endStream, std::span<const std::byte> data) {
  checkStreamId(streamId);
  _wbuf.clear();
  WriteDataFrame(_wbuf, streamId, data, endStream);
  endWrite();
}

void Framer::writeDataPadded(uint32_t streamId, bool endStream, std::span<const std::byte> data,
                             std::span<const std::byte> padding) {
  checkStreamId(streamId);
  if (!_options.allowIllegalWrites) {
    if (padding.size() > kMaxPadLength) {
      throw std::invalid_argument("pad length too large");
    }
    if (std::ranges::any_of(padding, [](std::byte byte) { return byte != std::byte{0}; })) {
      throw std::invalid_argument("padding bytes must all be zeros unless allowIllegalWrites is enabled");
    }
  }
  _wbuf.clear();
  WriteDataFramePadded(_wbuf, streamId, data, padding, endStream);
  endWrite();
}

void Framer::writeHeaders(const HeadersFrameParam& param) {
  checkStreamId(param.streamId);
  if (param.priority && !_options.allowIllegalWrites) {
    if (!IsValidStreamIdOrZero(param.priority->streamDependency)) {
      throw std::invalid_argument("invalid dependent stream ID");
    }
    if (param.priority->weight < 1 || param.priority->weight > 256) {
      throw std::invalid_argument("priority weight must be in [1, 256]");
    }
  }
  _wbuf.clear();
  WriteHeadersFrame(_wbuf, param);
  endWrite();
}

void Framer::writePriority(uint32_t streamId, PriorityParam priority) {
  checkStreamId(streamId);
  if (!_options.allowIllegalWrites) {
    if (!IsValidStreamIdOrZero(priority.streamDependency)) {
      throw std::invalid_argument("invalid dependent stream ID");
    }
    if (priority.weight < 1 || priority.weight > 256) {
      throw std::invalid_argument("priority weight must be in [1, 256]");
    }
  }
  _wbuf.clear();
  WritePriorityFrame(_wbuf, streamId, priority);
  endWrite();
}

void Framer::writeRstStream(uint32_t streamId, ErrorCode code) {
  checkStreamId(streamId);
  _wbuf.clear();
  WriteRstStreamFrame(_wbuf, streamId, code);
  endWrite();
}

void Framer::writeSettings(std::span<const SettingsEntry> entries) {
  _wbuf.clear();
  WriteSettingsFrame(_wbuf, entries);
  endWrite();
}

void Framer::writeSettingsAck() {
  _wbuf.clear();
  WriteSettingsAckFrame(_wbuf);
  endWrite();
}

void Framer::writePushPromise(const PushPromiseParam& param) {
  checkStreamId(param.streamId);
  if (!IsValidStreamId(param.promisedStreamId) && !_options.allowIllegalWrites) {
    throw std::invalid_argument(std::format("invalid promised stream ID {}", param.promisedStreamId));
  }
  _wbuf.clear();
  WritePushPromiseFrame(_wbuf, param);
  endWrite();
}

void Framer::writePing(bool ack, std::span<const std::byte, 8> data) {
  _wbuf.clear();
  WritePingFrame(_wbuf, data, ack);
  endWrite();
}

void Framer::writeGoAway(uint32_t lastStreamId, ErrorCode code, std::span<const std::byte> debugData) {
  _wbuf.clear();
  WriteGoAwayFrame(_wbuf, lastStreamId, code, debugData);
  endWrite();
}

void Framer::writeWindowUpdate(uint32_t streamId, uint32_t increment) {
  if (!_options.allowIllegalWrites) {
    if (increment < 1 || increment > kMaxWindowSize) {
      throw std::invalid_argument(std::format("illegal window increment value {}", increment));
    }
    if (!IsValidStreamIdOrZero(streamId)) {
      throw std::invalid_argument(std::format("invalid stream ID {}", streamId));
    }
  }
  _wbuf.clear();
  WriteWindowUpdateFrame(_wbuf, streamId, increment);
  endWrite();
}

void Framer::writeContinuation(uint32_t streamId, bool endHeaders, std::span<const std::byte> headerBlockFragment) {
  checkStreamId(streamId);
  _wbuf.clear();
  WriteContinuationFrame(_wbuf, streamId, headerBlockFragment, endHeaders);
  endWrite();
}

void Framer::writeRawFrame(FrameType type, uint8_t flags, uint32_t streamId, std::span<const std::byte> payload) {
  _wbuf.clear();
  WriteRawFrame(_wbuf, type, flags, streamId, payload);
  endWrite();
}

}  // namespace h2mux::http2
