#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "h2mux/big-endian.hpp"
#include "h2mux/byte-buffer.hpp"
#include "h2mux/http2-errors.hpp"
#include "h2mux/http2-frame-types.hpp"

namespace h2mux::http2 {

/// HTTP/2 frame header (9 bytes) as defined in RFC 9113 §4.1.
/// Layout: Length (3 bytes) | Type (1 byte) | Flags (1 byte) | Reserved (1 bit) | Stream ID (31 bits)
struct FrameHeader {
  static constexpr std::size_t kSize = kFrameHeaderSize;

  [[nodiscard]] constexpr bool hasFlag(uint8_t flag) const noexcept { return (flags & flag) != 0; }

  bool operator==(const FrameHeader&) const noexcept = default;

  uint32_t length{};  ///< Payload length (24 bits)
  FrameType type{};
  uint8_t flags{};
  uint32_t streamId{};  ///< 31-bit stream identifier, reserved bit always cleared on read
};

/// Parse a 9-byte frame header from raw bytes, masking the reserved stream id bit.
/// Precondition: data.size() >= FrameHeader::kSize
[[nodiscard]] FrameHeader ParseFrameHeader(std::span<const std::byte> data) noexcept;

/// Serialize a frame header to a 9-byte buffer.
void WriteFrameHeader(std::byte* buffer, FrameHeader header) noexcept;

/// One-line description of a frame header, for instance "[FrameHeader HEADERS flags=END_STREAM|END_HEADERS
/// stream=1 len=12]". Unknown flag bits are printed in hex.
[[nodiscard]] std::string DescribeFrameHeader(FrameHeader header);

// ============================
// Frame-specific structures
// ============================

/// Stream priority information (RFC 9113 §5.3, deprecated but still on the wire).
struct PriorityParam {
  uint32_t streamDependency{};
  uint16_t weight{16};  // 1-256 (wire value + 1)
  bool exclusive{};

  bool operator==(const PriorityParam&) const noexcept = default;
};

/// SETTINGS frame parameter (identifier + value pair).
struct SettingsEntry {
  SettingsParameter id;
  uint32_t value;

  bool operator==(const SettingsEntry&) const noexcept = default;
};

struct DataFrame {
  std::span<const std::byte> data;
  uint8_t padLength;
  bool endStream;
};

/// Parsed HEADERS frame. The header block fragment still needs header block decoding.
struct HeadersFrame {
  std::span<const std::byte> headerBlockFragment;
  std::optional<PriorityParam> priority;  // set iff the PRIORITY flag was present
  uint8_t padLength;
  bool endStream;
  bool endHeaders;
};

struct PriorityFrame {
  PriorityParam priority;
};

struct RstStreamFrame {
  ErrorCode errorCode;
};

/// Parsed SETTINGS frame: a view over the 6-byte entries of the payload.
struct SettingsFrame {
  static constexpr std::size_t kEntrySize = 6;

  [[nodiscard]] std::size_t numEntries() const noexcept { return payload.size() / kEntrySize; }

  [[nodiscard]] SettingsEntry entry(std::size_t idx) const noexcept {
    const std::byte* pos = payload.data() + (idx * kEntrySize);
    return {static_cast<SettingsParameter>(Read16BE(pos)), Read32BE(pos + 2)};
  }

  /// Value of the last occurrence of the given parameter, if any.
  [[nodiscard]] std::optional<uint32_t> value(SettingsParameter id) const noexcept;

  template <class Func>
  void forEach(Func&& func) const {
    for (std::size_t idx = 0; idx < numEntries(); ++idx) {
      func(entry(idx));
    }
  }

  std::span<const std::byte> payload;
  bool isAck;
};

struct PushPromiseFrame {
  std::span<const std::byte> headerBlockFragment;
  uint32_t promisedStreamId;
  uint8_t padLength;
  bool endHeaders;
};

struct PingFrame {
  std::array<std::byte, 8> opaqueData;
  bool isAck;
};

struct GoAwayFrame {
  std::span<const std::byte> debugData;
  uint32_t lastStreamId;
  ErrorCode errorCode;
};

struct WindowUpdateFrame {
  uint32_t windowSizeIncrement;
};

struct ContinuationFrame {
  std::span<const std::byte> headerBlockFragment;
  bool endHeaders;
};

/// Frame of an extension type, payload passed through untouched.
struct UnknownFrame {
  std::span<const std::byte> payload;
};

using FramePayload = std::variant<DataFrame, HeadersFrame, PriorityFrame, RstStreamFrame, SettingsFrame,
                                  PushPromiseFrame, PingFrame, GoAwayFrame, WindowUpdateFrame, ContinuationFrame,
                                  UnknownFrame>;

/// A decoded frame: header plus its typed payload.
///
/// Frames returned by a Framer in reuse mode borrow the Framer's read buffer: they are valid until the next
/// readFrame() call on that Framer, and any payload access afterwards throws FrameExpiredError. Frames decoded
/// in owning mode keep a shared reference to a copy of their payload and never expire.
class Frame {
 public:
  /// Borrowed frame, valid while *generationSource == generation.
  Frame(FrameHeader header, FramePayload payload, std::shared_ptr<const uint64_t> generationSource,
        uint64_t generation) noexcept
      : _header(header),
        _payload(std::move(payload)),
        _generationSource(std::move(generationSource)),
        _generation(generation) {}

  /// Owning frame, spans of the payload point into storage.
  Frame(FrameHeader header, FramePayload payload, std::shared_ptr<const ByteBuffer> storage) noexcept
      : _header(header), _payload(std::move(payload)), _storage(std::move(storage)) {}

  /// The header stays readable even after expiry.
  [[nodiscard]] const FrameHeader& header() const noexcept { return _header; }

  [[nodiscard]] FrameType type() const noexcept { return _header.type; }

  [[nodiscard]] uint32_t streamId() const noexcept { return _header.streamId; }

  [[nodiscard]] bool expired() const noexcept {
    return _generationSource && *_generationSource != _generation;
  }

  template <class T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(_payload);
  }

  /// Throws std::bad_variant_access if the frame is not a T, FrameExpiredError if expired.
  template <class T>
  [[nodiscard]] const T& get() const {
    checkValid();
    return std::get<T>(_payload);
  }

  template <class T>
  [[nodiscard]] const T* getIf() const {
    checkValid();
    return std::get_if<T>(&_payload);
  }

  template <class Visitor>
  decltype(auto) visit(Visitor&& visitor) const {
    checkValid();
    return std::visit(std::forward<Visitor>(visitor), _payload);
  }

 private:
  void checkValid() const {
    if (expired()) [[unlikely]] {
      throw FrameExpiredError();
    }
  }

  FrameHeader _header;
  FramePayload _payload;
  std::shared_ptr<const uint64_t> _generationSource;
  uint64_t _generation{};
  std::shared_ptr<const ByteBuffer> _storage;
};

/// One-line summary of a frame for debug logging: header description plus type-specific details.
[[nodiscard]] std::string SummarizeFrame(const Frame& frame);

// ============================
// Frame parsing functions
// ============================

enum class FrameParseResult : uint8_t {
  Ok,
  FrameSizeError,    // connection error FRAME_SIZE_ERROR
  ProtocolError,     // connection error PROTOCOL_ERROR
  InvalidPadding,    // connection error PROTOCOL_ERROR
  FlowControlError,  // connection error FLOW_CONTROL_ERROR
  StreamError,       // stream error PROTOCOL_ERROR on the frame's stream
};

/// Outcome of a payload parse. reason is a static description of the violated rule.
struct FrameParseStatus {
  [[nodiscard]] constexpr bool ok() const noexcept { return result == FrameParseResult::Ok; }

  constexpr bool operator==(FrameParseResult rhs) const noexcept { return result == rhs; }

  FrameParseResult result{FrameParseResult::Ok};
  std::string_view reason;
};

/// Maps a failed parse to the HTTP/2 error code it stands for.
[[nodiscard]] ErrorCode ToErrorCode(FrameParseResult result) noexcept;

// The parsers never throw and never read past payload. On failure, 'out' is left in an unspecified state.

[[nodiscard]] FrameParseStatus ParseDataFrame(FrameHeader header, std::span<const std::byte> payload,
                                              DataFrame& out) noexcept;

[[nodiscard]] FrameParseStatus ParseHeadersFrame(FrameHeader header, std::span<const std::byte> payload,
                                                 HeadersFrame& out) noexcept;

[[nodiscard]] FrameParseStatus ParsePriorityFrame(FrameHeader header, std::span<const std::byte> payload,
                                                  PriorityFrame& out) noexcept;

[[nodiscard]] FrameParseStatus ParseRstStreamFrame(FrameHeader header, std::span<const std::byte> payload,
                                                   RstStreamFrame& out) noexcept;

[[nodiscard]] FrameParseStatus ParseSettingsFrame(FrameHeader header, std::span<const std::byte> payload,
                                                  SettingsFrame& out) noexcept;

[[nodiscard]] FrameParseStatus ParsePushPromiseFrame(FrameHeader header, std::span<const std::byte> payload,
                                                     PushPromiseFrame& out) noexcept;

[[nodiscard]] FrameParseStatus ParsePingFrame(FrameHeader header, std::span<const std::byte> payload,
                                              PingFrame& out) noexcept;

[[nodiscard]] FrameParseStatus ParseGoAwayFrame(FrameHeader header, std::span<const std::byte> payload,
                                                GoAwayFrame& out) noexcept;

[[nodiscard]] FrameParseStatus ParseWindowUpdateFrame(FrameHeader header, std::span<const std::byte> payload,
                                                      WindowUpdateFrame& out) noexcept;

[[nodiscard]] FrameParseStatus ParseContinuationFrame(FrameHeader header, std::span<const std::byte> payload,
                                                      ContinuationFrame& out) noexcept;

/// Dispatches to the type-specific parser, falling back to UnknownFrame for extension types.
[[nodiscard]] FrameParseStatus ParseFramePayload(FrameHeader header, std::span<const std::byte> payload,
                                                 FramePayload& out) noexcept;

// ============================
// Frame writing functions
// ============================
// Each encoder appends one complete frame to the buffer: it reserves the 9-byte header, appends the payload and
// backpatches the length. They return the number of bytes appended.
// Arguments are not validated here, the Framer does it before encoding.

struct HeadersFrameParam {
  uint32_t streamId{};
  std::span<const std::byte> headerBlockFragment;
  std::optional<PriorityParam> priority;
  uint8_t padLength{};  // number of zero padding bytes, PADDED flag set if non-zero
  bool endStream{};
  bool endHeaders{};
};

struct PushPromiseParam {
  uint32_t streamId{};
  uint32_t promisedStreamId{};
  std::span<const std::byte> headerBlockFragment;
  uint8_t padLength{};  // number of zero padding bytes, PADDED flag set if non-zero
  bool endHeaders{};
};

/// Starts a frame by appending a header whose length is backpatched by EndFrame.
/// Returns the position of the header in the buffer.
std::size_t BeginFrame(ByteBuffer& buffer, FrameType type, uint8_t flags, uint32_t streamId);

/// Backpatches the 24-bit length of the frame started at headerPos and returns its payload length.
/// A payload length above kMaxMaxFrameSize is returned as is but cannot be represented on the wire.
std::size_t EndFrame(ByteBuffer& buffer, std::size_t headerPos) noexcept;

std::size_t WriteDataFrame(ByteBuffer& buffer, uint32_t streamId, std::span<const std::byte> data, bool endStream);

/// DATA frame with the PADDED flag. padding bytes are written as given.
std::size_t WriteDataFramePadded(ByteBuffer& buffer, uint32_t streamId, std::span<const std::byte> data,
                                 std::span<const std::byte> padding, bool endStream);

std::size_t WriteHeadersFrame(ByteBuffer& buffer, const HeadersFrameParam& param);

std::size_t WritePriorityFrame(ByteBuffer& buffer, uint32_t streamId, PriorityParam priority);

std::size_t WriteRstStreamFrame(ByteBuffer& buffer, uint32_t streamId, ErrorCode errorCode);

std::size_t WriteSettingsFrame(ByteBuffer& buffer, std::span<const SettingsEntry> entries);

std::size_t WriteSettingsAckFrame(ByteBuffer& buffer);

std::size_t WritePushPromiseFrame(ByteBuffer& buffer, const PushPromiseParam& param);

std::size_t WritePingFrame(ByteBuffer& buffer, std::span<const std::byte, 8> opaqueData, bool isAck);

std::size_t WriteGoAwayFrame(ByteBuffer& buffer, uint32_t lastStreamId, ErrorCode errorCode,
                             std::span<const std::byte> debugData = {});

std::size_t WriteWindowUpdateFrame(ByteBuffer& buffer, uint32_t streamId, uint32_t windowSizeIncrement);

std::size_t WriteContinuationFrame(ByteBuffer& buffer, uint32_t streamId, std::span<const std::byte> headerBlock,
                                   bool endHeaders);

/// Frame of arbitrary type and flags with an opaque payload.
std::size_t WriteRawFrame(ByteBuffer& buffer, FrameType type, uint8_t flags, uint32_t streamId,
                          std::span<const std::byte> payload);

}  // namespace h2mux::http2
