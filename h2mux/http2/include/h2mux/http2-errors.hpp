#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "h2mux/http2-frame-types.hpp"

namespace h2mux::http2 {

// Base of all HTTP/2 errors raised by the Framer and the ClientConnection.
// code() is the coarse classification callers should program against, what() the detail.
class Http2Error : public std::runtime_error {
 public:
  Http2Error(ErrorCode code, const std::string& detail) : std::runtime_error(detail), _code(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return _code; }

 private:
  ErrorCode _code;
};

// Connection-fatal error induced by the peer (protocol, frame size, flow control, compression).
class ConnectionError : public Http2Error {
 public:
  using Http2Error::Http2Error;
};

// Declared frame length exceeds the maximum read size, or a frame to write does not fit 24 bits.
class FrameTooLargeError : public ConnectionError {
 public:
  explicit FrameTooLargeError(const std::string& detail) : ConnectionError(ErrorCode::FrameSizeError, detail) {}
};

// Error scoped to a single stream. The connection stays usable.
class StreamError : public Http2Error {
 public:
  StreamError(uint32_t streamId, ErrorCode code, const std::string& detail)
      : Http2Error(code, detail), _streamId(streamId) {}

  [[nodiscard]] uint32_t streamId() const noexcept { return _streamId; }

 private:
  uint32_t _streamId;
};

// The peer sent RST_STREAM. code() is the reason announced by the peer.
class StreamResetError : public StreamError {
 public:
  StreamResetError(uint32_t streamId, ErrorCode code)
      : StreamError(streamId, code,
                    "stream " + std::to_string(streamId) + " reset by peer: " + std::string(ErrorCodeName(code))) {}
};

// Operation on a stream that is unknown, already finished or no longer writable.
class StreamClosedError : public StreamError {
 public:
  StreamClosedError(uint32_t streamId, const std::string& detail)
      : StreamError(streamId, ErrorCode::StreamClosed, detail) {}
};

// Stream refused because of a GOAWAY: either its id is above the peer's last processed stream id, or a new stream
// was attempted after GOAWAY.
class GoAwayRefusedError : public Http2Error {
 public:
  GoAwayRefusedError(uint32_t streamId, uint32_t lastStreamId, const std::string& detail)
      : Http2Error(ErrorCode::RefusedStream, detail), _streamId(streamId), _lastStreamId(lastStreamId) {}

  // 0 if no stream id was allocated.
  [[nodiscard]] uint32_t streamId() const noexcept { return _streamId; }

  [[nodiscard]] uint32_t lastStreamId() const noexcept { return _lastStreamId; }

 private:
  uint32_t _streamId;
  uint32_t _lastStreamId;
};

// The connection is closed. Delivered to every pending waiter, carrying the terminal code and reason.
class ConnectionClosedError : public Http2Error {
 public:
  using Http2Error::Http2Error;
};

// Failure of the underlying transport: failed or short write, read error, or EOF.
// isEof() tells an orderly close at a frame boundary apart from a truncated frame.
class TransportError : public Http2Error {
 public:
  explicit TransportError(const std::string& detail, bool eof = false)
      : Http2Error(ErrorCode::InternalError, detail), _eof(eof) {}

  [[nodiscard]] bool isEof() const noexcept { return _eof; }

 private:
  bool _eof;
};

class PingTimeoutError : public Http2Error {
 public:
  explicit PingTimeoutError(const std::string& detail) : Http2Error(ErrorCode::NoError, detail) {}
};

// Outcome of a locally cancelled stream operation. Not an Http2Error: cancellation is not a protocol failure.
class CanceledError : public std::runtime_error {
 public:
  explicit CanceledError(uint32_t streamId)
      : std::runtime_error("stream " + std::to_string(streamId) + " canceled"), _streamId(streamId) {}

  [[nodiscard]] uint32_t streamId() const noexcept { return _streamId; }

 private:
  uint32_t _streamId;
};

// Programming error: a borrowed frame was accessed after the Framer read the next frame.
class FrameExpiredError : public std::logic_error {
 public:
  FrameExpiredError() : std::logic_error("frame accessed after the next readFrame call") {}
};

}  // namespace h2mux::http2
