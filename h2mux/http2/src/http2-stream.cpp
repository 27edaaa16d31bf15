#include "h2mux/http2-stream.hpp"

#include "h2mux/http2-frame-types.hpp"

namespace h2mux::http2 {

ErrorCode Http2Stream::onSendHeaders(bool endStream) noexcept {
  switch (_state) {
    case StreamState::Idle:
      _state = endStream ? StreamState::HalfClosedLocal : StreamState::Open;
      return ErrorCode::NoError;

    case StreamState::Open:
      // Request trailers
      if (endStream) {
        _state = StreamState::HalfClosedLocal;
      }
      return ErrorCode::NoError;

    case StreamState::HalfClosedRemote:
      if (endStream) {
        _state = StreamState::Closed;
      }
      return ErrorCode::NoError;

    default:
      return ErrorCode::StreamClosed;
  }
}

ErrorCode Http2Stream::onRecvHeaders(bool endStream) noexcept {
  switch (_state) {
    case StreamState::Open:
      if (endStream) {
        _state = StreamState::HalfClosedRemote;
        _endStreamReceived = true;
      }
      return ErrorCode::NoError;

    case StreamState::HalfClosedLocal:
      // Request fully sent, the response may still carry headers, data then trailers.
      if (endStream) {
        _state = StreamState::Closed;
        _endStreamReceived = true;
      }
      return ErrorCode::NoError;

    default:
      // Idle: the peer cannot open streams towards a client (push is disabled).
      return ErrorCode::StreamClosed;
  }
}

ErrorCode Http2Stream::onSendData(bool endStream) noexcept {
  switch (_state) {
    case StreamState::Open:
      if (endStream) {
        _state = StreamState::HalfClosedLocal;
      }
      return ErrorCode::NoError;

    case StreamState::HalfClosedRemote:
      if (endStream) {
        _state = StreamState::Closed;
      }
      return ErrorCode::NoError;

    default:
      return ErrorCode::StreamClosed;
  }
}

ErrorCode Http2Stream::onRecvData(bool endStream) noexcept {
  switch (_state) {
    case StreamState::Open:
      if (endStream) {
        _state = StreamState::HalfClosedRemote;
        _endStreamReceived = true;
      }
      return ErrorCode::NoError;

    case StreamState::HalfClosedLocal:
      if (endStream) {
        _state = StreamState::Closed;
        _endStreamReceived = true;
      }
      return ErrorCode::NoError;

    default:
      return ErrorCode::StreamClosed;
  }
}

}  // namespace h2mux::http2
