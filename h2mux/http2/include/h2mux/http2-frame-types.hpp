#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace h2mux::http2 {

// HTTP/2 Protocol Constants (RFC 9113)
// ====================================

// Connection preface: client must send this magic string first (RFC 9113 §3.4)
inline constexpr std::string_view kClientPreface = "PRI * HTTP/2.0\r\n\r\nSM\r\n\r\n";

// HTTP/2 Frame Types (RFC 9113 §6)
// ================================
// Any other value is an extension frame type, delivered as an UnknownFrame.
enum class FrameType : uint8_t {
  Data = 0x00,
  Headers = 0x01,
  Priority = 0x02,
  RstStream = 0x03,
  Settings = 0x04,
  PushPromise = 0x05,
  Ping = 0x06,
  GoAway = 0x07,
  WindowUpdate = 0x08,
  Continuation = 0x09,
};

inline constexpr uint8_t kNbKnownFrameTypes = 10;

[[nodiscard]] constexpr bool IsKnownFrameType(FrameType type) noexcept {
  return static_cast<uint8_t>(type) < kNbKnownFrameTypes;
}

// HTTP/2 Error Codes (RFC 9113 §7)
// ================================
// 32-bit values on the wire; unknown values are kept as-is.
enum class ErrorCode : uint32_t {  // NOLINT(performance-enum-size)
  NoError = 0x00,
  ProtocolError = 0x01,
  InternalError = 0x02,
  FlowControlError = 0x03,
  SettingsTimeout = 0x04,
  StreamClosed = 0x05,
  FrameSizeError = 0x06,
  RefusedStream = 0x07,
  Cancel = 0x08,
  CompressionError = 0x09,
  ConnectError = 0x0A,
  EnhanceYourCalm = 0x0B,
  InadequateSecurity = 0x0C,
  Http11Required = 0x0D,
};

// HTTP/2 Settings Parameters (RFC 9113 §6.5.2)
// =============================================
enum class SettingsParameter : uint16_t {  // NOLINT(performance-enum-size)
  HeaderTableSize = 0x01,
  EnablePush = 0x02,
  MaxConcurrentStreams = 0x03,
  InitialWindowSize = 0x04,
  MaxFrameSize = 0x05,
  MaxHeaderListSize = 0x06,
};

// HTTP/2 Frame Flags (RFC 9113 §6)
// ================================
// Flag bits are shared between frame types, their meaning depends on the type.
namespace FrameFlags {

inline constexpr uint8_t None = 0x00;

inline constexpr uint8_t EndStream = 0x01;   // DATA, HEADERS
inline constexpr uint8_t Ack = 0x01;         // SETTINGS, PING
inline constexpr uint8_t EndHeaders = 0x04;  // HEADERS, PUSH_PROMISE, CONTINUATION
inline constexpr uint8_t Padded = 0x08;      // DATA, HEADERS, PUSH_PROMISE
inline constexpr uint8_t Priority = 0x20;    // HEADERS

}  // namespace FrameFlags

// HTTP/2 Default Values (RFC 9113 §6.5.2)
// =======================================
inline constexpr uint32_t kDefaultHeaderTableSize = 4096;
inline constexpr uint32_t kDefaultInitialWindowSize = 65535;
inline constexpr uint32_t kDefaultMaxFrameSize = 16384;

// HTTP/2 Limits (RFC 9113)
// ========================
inline constexpr uint32_t kMinMaxFrameSize = 16384;     // Minimum allowed SETTINGS_MAX_FRAME_SIZE
inline constexpr uint32_t kMaxMaxFrameSize = 16777215;  // Maximum allowed SETTINGS_MAX_FRAME_SIZE (2^24 - 1)
inline constexpr uint32_t kMaxWindowSize = 2147483647;  // Maximum flow control window size (2^31 - 1)
inline constexpr uint32_t kMaxStreamId = 2147483647;    // Maximum stream identifier (2^31 - 1)
inline constexpr uint32_t kStreamIdMask = 0x7FFFFFFF;   // Clears the reserved bit
inline constexpr std::size_t kMaxPadLength = 255;

// Frame header size is always 9 bytes
inline constexpr std::size_t kFrameHeaderSize = 9;

// Stream 0 is the connection control stream
inline constexpr uint32_t kConnectionStreamId = 0;

[[nodiscard]] constexpr bool IsClientStream(uint32_t streamId) noexcept { return (streamId & 1) != 0; }

[[nodiscard]] constexpr bool IsServerStream(uint32_t streamId) noexcept { return streamId != 0 && (streamId & 1) == 0; }

// Valid for a frame addressed to a stream: non-zero and reserved bit clear.
[[nodiscard]] constexpr bool IsValidStreamId(uint32_t streamId) noexcept {
  return streamId != 0 && (streamId & ~kStreamIdMask) == 0;
}

// Valid where stream 0 is also allowed (GOAWAY last stream id, WINDOW_UPDATE, PRIORITY dependency).
[[nodiscard]] constexpr bool IsValidStreamIdOrZero(uint32_t streamId) noexcept {
  return (streamId & ~kStreamIdMask) == 0;
}

// HTTP/2 Stream States (RFC 9113 §5.1)
// ====================================
// Push is never accepted, so the reserved states are not modelled.
enum class StreamState : uint8_t {
  Idle,
  Open,
  HalfClosedLocal,   // We sent END_STREAM
  HalfClosedRemote,  // Peer sent END_STREAM
  Closed,
};

constexpr std::string_view FrameTypeName(FrameType type) noexcept {
  switch (type) {
    case FrameType::Data:
      return "DATA";
    case FrameType::Headers:
      return "HEADERS";
    case FrameType::Priority:
      return "PRIORITY";
    case FrameType::RstStream:
      return "RST_STREAM";
    case FrameType::Settings:
      return "SETTINGS";
    case FrameType::PushPromise:
      return "PUSH_PROMISE";
    case FrameType::Ping:
      return "PING";
    case FrameType::GoAway:
      return "GOAWAY";
    case FrameType::WindowUpdate:
      return "WINDOW_UPDATE";
    case FrameType::Continuation:
      return "CONTINUATION";
    default:
      return "UNKNOWN";
  }
}

constexpr std::string_view ErrorCodeName(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::NoError:
      return "NO_ERROR";
    case ErrorCode::ProtocolError:
      return "PROTOCOL_ERROR";
    case ErrorCode::InternalError:
      return "INTERNAL_ERROR";
    case ErrorCode::FlowControlError:
      return "FLOW_CONTROL_ERROR";
    case ErrorCode::SettingsTimeout:
      return "SETTINGS_TIMEOUT";
    case ErrorCode::StreamClosed:
      return "STREAM_CLOSED";
    case ErrorCode::FrameSizeError:
      return "FRAME_SIZE_ERROR";
    case ErrorCode::RefusedStream:
      return "REFUSED_STREAM";
    case ErrorCode::Cancel:
      return "CANCEL";
    case ErrorCode::CompressionError:
      return "COMPRESSION_ERROR";
    case ErrorCode::ConnectError:
      return "CONNECT_ERROR";
    case ErrorCode::EnhanceYourCalm:
      return "ENHANCE_YOUR_CALM";
    case ErrorCode::InadequateSecurity:
      return "INADEQUATE_SECURITY";
    case ErrorCode::Http11Required:
      return "HTTP_1_1_REQUIRED";
    default:
      return "UNKNOWN_ERROR";
  }
}

constexpr std::string_view SettingsParameterName(SettingsParameter param) noexcept {
  switch (param) {
    case SettingsParameter::HeaderTableSize:
      return "HEADER_TABLE_SIZE";
    case SettingsParameter::EnablePush:
      return "ENABLE_PUSH";
    case SettingsParameter::MaxConcurrentStreams:
      return "MAX_CONCURRENT_STREAMS";
    case SettingsParameter::InitialWindowSize:
      return "INITIAL_WINDOW_SIZE";
    case SettingsParameter::MaxFrameSize:
      return "MAX_FRAME_SIZE";
    case SettingsParameter::MaxHeaderListSize:
      return "MAX_HEADER_LIST_SIZE";
    default:
      return "UNKNOWN_SETTING";
  }
}

[[nodiscard]] constexpr std::string_view StreamStateName(StreamState state) noexcept {
  switch (state) {
    case StreamState::Idle:
      return "idle";
    case StreamState::Open:
      return "open";
    case StreamState::HalfClosedLocal:
      return "half-closed (local)";
    case StreamState::HalfClosedRemote:
      return "half-closed (remote)";
    case StreamState::Closed:
      return "closed";
    default:
      return "unknown";
  }
}

}  // namespace h2mux::http2
