#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <utility>

#include "h2mux/byte-buffer.hpp"
#include "h2mux/flow-window.hpp"
#include "h2mux/header-codec.hpp"
#include "h2mux/http2-frame-types.hpp"

namespace h2mux::http2 {

/// Client side HTTP/2 stream (RFC 9113 §5).
///
/// Tracks the RFC state machine, both flow-control windows, and what the peer delivered so far: response headers,
/// buffered DATA not yet consumed by the application, trailers, and a possible RST_STREAM.
///
/// Thread safety: NOT thread-safe. The ClientConnection only touches streams under its state lock.
class Http2Stream {
 public:
  Http2Stream(uint32_t streamId, int32_t sendWindow, int32_t recvWindow) noexcept
      : _streamId(streamId), _sendWindow(sendWindow), _recvWindow(recvWindow) {}

  [[nodiscard]] uint32_t id() const noexcept { return _streamId; }

  [[nodiscard]] StreamState state() const noexcept { return _state; }

  /// Whether we may still send DATA or trailers.
  [[nodiscard]] bool canSend() const noexcept {
    return _state == StreamState::Open || _state == StreamState::HalfClosedRemote;
  }

  /// Whether the peer may still send frames on this stream.
  [[nodiscard]] bool canReceive() const noexcept {
    return _state == StreamState::Open || _state == StreamState::HalfClosedLocal;
  }

  [[nodiscard]] bool isClosed() const noexcept { return _state == StreamState::Closed; }

  // ============================
  // State transitions
  // ============================
  // Each returns ErrorCode::StreamClosed if the transition is invalid in the current state, NoError otherwise.

  [[nodiscard]] ErrorCode onSendHeaders(bool endStream) noexcept;

  [[nodiscard]] ErrorCode onRecvHeaders(bool endStream) noexcept;

  [[nodiscard]] ErrorCode onSendData(bool endStream) noexcept;

  [[nodiscard]] ErrorCode onRecvData(bool endStream) noexcept;

  /// We reset the stream. Returns true the first time only, so that RST_STREAM is written at most once.
  [[nodiscard]] bool onSendRstStream() noexcept {
    _state = StreamState::Closed;
    return !std::exchange(_didReset, true);
  }

  void onRecvRstStream(ErrorCode code) noexcept {
    _state = StreamState::Closed;
    _resetCode = code;
  }

  /// The peer will never process this stream (its id is above the last stream id of a GOAWAY).
  void onRefused() noexcept { _state = StreamState::Closed; }

  /// Locally cancelled: waiters resolve with CanceledError.
  void markCanceled() noexcept { _canceled = true; }

  /// Records the error that terminates operations on this stream. Only the first one is kept.
  void fail(std::exception_ptr error) noexcept {
    if (!_failure) {
      _failure = std::move(error);
    }
  }

  [[nodiscard]] const std::exception_ptr& failure() const noexcept { return _failure; }

  // ============================
  // Flow control
  // ============================

  [[nodiscard]] FlowWindow& sendWindow() noexcept { return _sendWindow; }
  [[nodiscard]] const FlowWindow& sendWindow() const noexcept { return _sendWindow; }

  [[nodiscard]] FlowWindow& recvWindow() noexcept { return _recvWindow; }
  [[nodiscard]] const FlowWindow& recvWindow() const noexcept { return _recvWindow; }

  // ============================
  // Delivered data
  // ============================

  [[nodiscard]] bool headersReceived() const noexcept { return _headers.has_value(); }

  [[nodiscard]] bool trailersReceived() const noexcept { return _trailers.has_value(); }

  [[nodiscard]] const std::optional<HeaderList>& headers() const noexcept { return _headers; }

  [[nodiscard]] const std::optional<HeaderList>& trailers() const noexcept { return _trailers; }

  void setHeaders(HeaderList headers) { _headers = std::move(headers); }

  void setTrailers(HeaderList trailers) { _trailers = std::move(trailers); }

  /// DATA payload received but not yet read by the application.
  [[nodiscard]] ByteBuffer& recvBuffer() noexcept { return _recvBuffer; }
  [[nodiscard]] const ByteBuffer& recvBuffer() const noexcept { return _recvBuffer; }

  /// Whether the peer finished its side (END_STREAM received).
  [[nodiscard]] bool endStreamReceived() const noexcept { return _endStreamReceived; }

  [[nodiscard]] bool didReset() const noexcept { return _didReset; }

  [[nodiscard]] bool canceled() const noexcept { return _canceled; }

  [[nodiscard]] bool resetReceived() const noexcept { return _resetCode.has_value(); }

  [[nodiscard]] ErrorCode resetCode() const noexcept { return _resetCode.value_or(ErrorCode::NoError); }

 private:
  uint32_t _streamId;
  FlowWindow _sendWindow;
  FlowWindow _recvWindow;
  ByteBuffer _recvBuffer;
  std::optional<HeaderList> _headers;
  std::optional<HeaderList> _trailers;
  std::optional<ErrorCode> _resetCode;
  std::exception_ptr _failure;
  StreamState _state{StreamState::Idle};
  bool _endStreamReceived{false};
  bool _didReset{false};
  bool _canceled{false};
};

}  // namespace h2mux::http2
