#include "h2mux/http2-frame.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "h2mux/big-endian.hpp"
#include "h2mux/byte-buffer.hpp"
#include "h2mux/http2-frame-types.hpp"

namespace h2mux::http2 {

namespace {

constexpr std::size_t kPriorityPayloadSize = 5;
constexpr std::size_t kMaxLoggedDataBytes = 256;

constexpr FrameParseStatus Fail(FrameParseResult result, std::string_view reason) noexcept { return {result, reason}; }

constexpr std::string_view FlagName(FrameType type, uint8_t bit) noexcept {
  switch (type) {
    case FrameType::Data:
      if (bit == FrameFlags::EndStream) {
        return "END_STREAM";
      }
      if (bit == FrameFlags::Padded) {
        return "PADDED";
      }
      break;
    case FrameType::Headers:
      if (bit == FrameFlags::EndStream) {
        return "END_STREAM";
      }
      if (bit == FrameFlags::EndHeaders) {
        return "END_HEADERS";
      }
      if (bit == FrameFlags::Padded) {
        return "PADDED";
      }
      if (bit == FrameFlags::Priority) {
        return "PRIORITY";
      }
      break;
    case FrameType::Settings:
      [[fallthrough]];
    case FrameType::Ping:
      if (bit == FrameFlags::Ack) {
        return "ACK";
      }
      break;
    case FrameType::PushPromise:
      if (bit == FrameFlags::EndHeaders) {
        return "END_HEADERS";
      }
      if (bit == FrameFlags::Padded) {
        return "PADDED";
      }
      break;
    case FrameType::Continuation:
      if (bit == FrameFlags::EndHeaders) {
        return "END_HEADERS";
      }
      break;
    default:
      break;
  }
  return {};
}

PriorityParam ReadPriority(const std::byte* data) noexcept {
  const uint32_t depAndExcl = Read32BE(data);
  PriorityParam priority;
  priority.exclusive = (depAndExcl & ~kStreamIdMask) != 0;
  priority.streamDependency = depAndExcl & kStreamIdMask;
  // RFC 9113 §5.3.1: "Add one to the value to obtain a weight between 1 and 256."
  priority.weight = static_cast<uint16_t>(static_cast<uint8_t>(data[4]) + 1);
  return priority;
}

void AppendPriority(ByteBuffer& buffer, PriorityParam priority) {
  uint32_t depWithExcl = priority.streamDependency;
  if (priority.exclusive) {
    depWithExcl |= ~kStreamIdMask;
  }
  buffer.ensureAvailableCapacity(kPriorityPayloadSize);
  Write32BE(buffer.end(), depWithExcl);
  buffer.addSize(4);
  buffer.unchecked_push_back(static_cast<std::byte>(priority.weight - 1));
}

// Reads the optional pad length byte of a PADDED frame. Returns false if the payload is empty.
bool ConsumePadLength(FrameHeader header, std::span<const std::byte>& payload, uint8_t& padLength) noexcept {
  padLength = 0;
  if (!header.hasFlag(FrameFlags::Padded)) {
    return true;
  }
  if (payload.empty()) {
    return false;
  }
  padLength = static_cast<uint8_t>(payload[0]);
  payload = payload.subspan(1);
  return true;
}

void AppendQuoted(std::string& out, std::span<const std::byte> bytes) {
  out.push_back('"');
  for (std::byte byte : bytes) {
    const auto ch = static_cast<unsigned char>(byte);
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
      out.push_back(static_cast<char>(ch));
    } else if (ch >= 0x20 && ch < 0x7F) {
      out.push_back(static_cast<char>(ch));
    } else {
      std::format_to(std::back_inserter(out), "\\x{:02x}", ch);
    }
  }
  out.push_back('"');
}

}  // namespace

// ============================
// Frame header parsing/writing
// ============================

FrameHeader ParseFrameHeader(std::span<const std::byte> data) noexcept {
  assert(data.size() >= FrameHeader::kSize);

  FrameHeader header;
  header.length = Read24BE(data.data());
  header.type = static_cast<FrameType>(data[3]);
  header.flags = static_cast<uint8_t>(data[4]);
  header.streamId = Read32BE(data.data() + 5) & kStreamIdMask;
  return header;
}

void WriteFrameHeader(std::byte* buffer, FrameHeader header) noexcept {
  Write24BE(buffer, header.length);
  buffer[3] = static_cast<std::byte>(header.type);
  buffer[4] = static_cast<std::byte>(header.flags);
  Write32BE(buffer + 5, header.streamId);
}

std::string DescribeFrameHeader(FrameHeader header) {
  std::string out("[FrameHeader ");
  if (IsKnownFrameType(header.type)) {
    out.append(FrameTypeName(header.type));
  } else {
    std::format_to(std::back_inserter(out), "UNKNOWN_FRAME_TYPE_{}", static_cast<uint8_t>(header.type));
  }
  if (header.flags != 0) {
    out.append(" flags=");
    bool first = true;
    for (uint32_t bit = 1; bit <= 0x80; bit <<= 1) {
      if ((header.flags & bit) == 0) {
        continue;
      }
      if (!first) {
        out.push_back('|');
      }
      first = false;
      const std::string_view name = FlagName(header.type, static_cast<uint8_t>(bit));
      if (name.empty()) {
        std::format_to(std::back_inserter(out), "0x{:x}", bit);
      } else {
        out.append(name);
      }
    }
  }
  if (header.streamId != 0) {
    std::format_to(std::back_inserter(out), " stream={}", header.streamId);
  }
  std::format_to(std::back_inserter(out), " len={}]", header.length);
  return out;
}

std::optional<uint32_t> SettingsFrame::value(SettingsParameter id) const noexcept {
  std::optional<uint32_t> ret;
  for (std::size_t idx = 0; idx < numEntries(); ++idx) {
    const SettingsEntry setting = entry(idx);
    if (setting.id == id) {
      ret = setting.value;
    }
  }
  return ret;
}

std::string SummarizeFrame(const Frame& frame) {
  std::string out = DescribeFrameHeader(frame.header());
  auto it = std::back_inserter(out);
  frame.visit([&out, &it](const auto& typed) {
    using T = std::decay_t<decltype(typed)>;
    if constexpr (std::is_same_v<T, DataFrame>) {
      out.append(" data=");
      AppendQuoted(out, typed.data.first(std::min(typed.data.size(), kMaxLoggedDataBytes)));
      if (typed.data.size() > kMaxLoggedDataBytes) {
        std::format_to(it, " ({} bytes omitted)", typed.data.size() - kMaxLoggedDataBytes);
      }
    } else if constexpr (std::is_same_v<T, SettingsFrame>) {
      typed.forEach([&it](SettingsEntry entry) {
        std::format_to(it, " {}={}", SettingsParameterName(entry.id), entry.value);
        if (SettingsParameterName(entry.id) == "UNKNOWN_SETTING") {
          std::format_to(it, "(id {})", static_cast<uint16_t>(entry.id));
        }
      });
    } else if constexpr (std::is_same_v<T, PingFrame>) {
      out.append(" ping=");
      AppendQuoted(out, typed.opaqueData);
    } else if constexpr (std::is_same_v<T, GoAwayFrame>) {
      std::format_to(it, " lastStreamId={} errCode={}", typed.lastStreamId, ErrorCodeName(typed.errorCode));
      if (!typed.debugData.empty()) {
        out.append(" debug=");
        AppendQuoted(out, typed.debugData);
      }
    } else if constexpr (std::is_same_v<T, RstStreamFrame>) {
      std::format_to(it, " errCode={}", ErrorCodeName(typed.errorCode));
    } else if constexpr (std::is_same_v<T, WindowUpdateFrame>) {
      std::format_to(it, " incr={}", typed.windowSizeIncrement);
    } else if constexpr (std::is_same_v<T, PriorityFrame>) {
      std::format_to(it, " dep={} weight={} exclusive={}", typed.priority.streamDependency, typed.priority.weight,
                     typed.priority.exclusive);
    } else if constexpr (std::is_same_v<T, PushPromiseFrame>) {
      std::format_to(it, " promised={}", typed.promisedStreamId);
    }
  });
  return out;
}

// ============================
// Frame parsing functions
// ============================

ErrorCode ToErrorCode(FrameParseResult result) noexcept {
  switch (result) {
    case FrameParseResult::Ok:
      return ErrorCode::NoError;
    case FrameParseResult::FrameSizeError:
      return ErrorCode::FrameSizeError;
    case FrameParseResult::FlowControlError:
      return ErrorCode::FlowControlError;
    default:
      return ErrorCode::ProtocolError;
  }
}

FrameParseStatus ParseDataFrame(FrameHeader header, std::span<const std::byte> payload, DataFrame& out) noexcept {
  if (header.streamId == 0) {
    return Fail(FrameParseResult::ProtocolError, "DATA frame with stream ID 0");
  }
  out.endStream = header.hasFlag(FrameFlags::EndStream);
  if (!ConsumePadLength(header, payload, out.padLength)) {
    return Fail(FrameParseResult::FrameSizeError, "padded DATA frame without pad length");
  }
  if (out.padLength > payload.size()) {
    return Fail(FrameParseResult::InvalidPadding, "pad size larger than data payload");
  }
  out.data = payload.first(payload.size() - out.padLength);
  return {};
}

FrameParseStatus ParseHeadersFrame(FrameHeader header, std::span<const std::byte> payload, HeadersFrame& out) noexcept {
  if (header.streamId == 0) {
    return Fail(FrameParseResult::ProtocolError, "HEADERS frame with stream ID 0");
  }
  out.endStream = header.hasFlag(FrameFlags::EndStream);
  out.endHeaders = header.hasFlag(FrameFlags::EndHeaders);
  out.priority.reset();

  if (!ConsumePadLength(header, payload, out.padLength)) {
    return Fail(FrameParseResult::FrameSizeError, "padded HEADERS frame without pad length");
  }
  if (header.hasFlag(FrameFlags::Priority)) {
    if (payload.size() < kPriorityPayloadSize) {
      return Fail(FrameParseResult::FrameSizeError, "HEADERS frame too small for priority fields");
    }
    out.priority = ReadPriority(payload.data());
    payload = payload.subspan(kPriorityPayloadSize);
  }
  if (out.padLength > payload.size()) {
    return Fail(FrameParseResult::InvalidPadding, "pad size larger than header block fragment");
  }
  out.headerBlockFragment = payload.first(payload.size() - out.padLength);
  return {};
}

FrameParseStatus ParsePriorityFrame(FrameHeader header, std::span<const std::byte> payload,
                                    PriorityFrame& out) noexcept {
  if (header.streamId == 0) {
    return Fail(FrameParseResult::ProtocolError, "PRIORITY frame with stream ID 0");
  }
  if (payload.size() != kPriorityPayloadSize) {
    return Fail(FrameParseResult::FrameSizeError, "PRIORITY frame payload size must be 5");
  }
  out.priority = ReadPriority(payload.data());
  if (out.priority.streamDependency == header.streamId) {
    return Fail(FrameParseResult::StreamError, "stream depends on itself");
  }
  return {};
}

FrameParseStatus ParseRstStreamFrame(FrameHeader header, std::span<const std::byte> payload,
                                     RstStreamFrame& out) noexcept {
  if (payload.size() != 4) {
    return Fail(FrameParseResult::FrameSizeError, "RST_STREAM frame payload size must be 4");
  }
  if (header.streamId == 0) {
    return Fail(FrameParseResult::ProtocolError, "RST_STREAM frame with stream ID 0");
  }
  out.errorCode = static_cast<ErrorCode>(Read32BE(payload.data()));
  return {};
}

FrameParseStatus ParseSettingsFrame(FrameHeader header, std::span<const std::byte> payload,
                                    SettingsFrame& out) noexcept {
  if (header.streamId != 0) {
    return Fail(FrameParseResult::ProtocolError, "SETTINGS frame with non-zero stream ID");
  }
  out.isAck = header.hasFlag(FrameFlags::Ack);
  out.payload = payload;
  if (out.isAck && !payload.empty()) {
    return Fail(FrameParseResult::FrameSizeError, "SETTINGS ACK with non-empty payload");
  }
  if (payload.size() % SettingsFrame::kEntrySize != 0) {
    return Fail(FrameParseResult::FrameSizeError, "SETTINGS payload size not a multiple of 6");
  }
  for (std::size_t idx = 0; idx < out.numEntries(); ++idx) {
    const SettingsEntry entry = out.entry(idx);
    if (entry.id == SettingsParameter::InitialWindowSize && entry.value > kMaxWindowSize) {
      return Fail(FrameParseResult::FlowControlError, "SETTINGS_INITIAL_WINDOW_SIZE above 2^31-1");
    }
  }
  return {};
}

FrameParseStatus ParsePushPromiseFrame(FrameHeader header, std::span<const std::byte> payload,
                                       PushPromiseFrame& out) noexcept {
  if (header.streamId == 0) {
    return Fail(FrameParseResult::ProtocolError, "PUSH_PROMISE frame with stream ID 0");
  }
  out.endHeaders = header.hasFlag(FrameFlags::EndHeaders);
  if (!ConsumePadLength(header, payload, out.padLength)) {
    return Fail(FrameParseResult::FrameSizeError, "padded PUSH_PROMISE frame without pad length");
  }
  if (payload.size() < 4) {
    return Fail(FrameParseResult::FrameSizeError, "PUSH_PROMISE frame too small for promised stream ID");
  }
  out.promisedStreamId = Read32BE(payload.data()) & kStreamIdMask;
  payload = payload.subspan(4);
  if (out.padLength > payload.size()) {
    return Fail(FrameParseResult::InvalidPadding, "pad size larger than header block fragment");
  }
  out.headerBlockFragment = payload.first(payload.size() - out.padLength);
  return {};
}

FrameParseStatus ParsePingFrame(FrameHeader header, std::span<const std::byte> payload, PingFrame& out) noexcept {
  if (payload.size() != out.opaqueData.size()) {
    return Fail(FrameParseResult::FrameSizeError, "PING frame payload size must be 8");
  }
  if (header.streamId != 0) {
    return Fail(FrameParseResult::ProtocolError, "PING frame with non-zero stream ID");
  }
  out.isAck = header.hasFlag(FrameFlags::Ack);
  std::memcpy(out.opaqueData.data(), payload.data(), out.opaqueData.size());
  return {};
}

FrameParseStatus ParseGoAwayFrame(FrameHeader header, std::span<const std::byte> payload, GoAwayFrame& out) noexcept {
  if (header.streamId != 0) {
    return Fail(FrameParseResult::ProtocolError, "GOAWAY frame with non-zero stream ID");
  }
  if (payload.size() < 8) {
    return Fail(FrameParseResult::FrameSizeError, "GOAWAY frame payload smaller than 8 bytes");
  }
  out.lastStreamId = Read32BE(payload.data()) & kStreamIdMask;
  out.errorCode = static_cast<ErrorCode>(Read32BE(payload.data() + 4));
  out.debugData = payload.subspan(8);
  return {};
}

FrameParseStatus ParseWindowUpdateFrame(FrameHeader header, std::span<const std::byte> payload,
                                        WindowUpdateFrame& out) noexcept {
  if (payload.size() != 4) {
    return Fail(FrameParseResult::FrameSizeError, "WINDOW_UPDATE frame payload size must be 4");
  }
  out.windowSizeIncrement = Read32BE(payload.data()) & kStreamIdMask;
  if (out.windowSizeIncrement == 0) {
    // A zero increment only kills the addressed stream, unless it targets the connection window.
    if (header.streamId == 0) {
      return Fail(FrameParseResult::ProtocolError, "WINDOW_UPDATE with zero increment on the connection");
    }
    return Fail(FrameParseResult::StreamError, "WINDOW_UPDATE with zero increment");
  }
  return {};
}

FrameParseStatus ParseContinuationFrame(FrameHeader header, std::span<const std::byte> payload,
                                        ContinuationFrame& out) noexcept {
  if (header.streamId == 0) {
    return Fail(FrameParseResult::ProtocolError, "CONTINUATION frame with stream ID 0");
  }
  out.endHeaders = header.hasFlag(FrameFlags::EndHeaders);
  out.headerBlockFragment = payload;
  return {};
}

FrameParseStatus ParseFramePayload(FrameHeader header, std::span<const std::byte> payload,
                                   FramePayload& out) noexcept {
  switch (header.type) {
    case FrameType::Data:
      return ParseDataFrame(header, payload, out.emplace<DataFrame>());
    case FrameType::Headers:
      return ParseHeadersFrame(header, payload, out.emplace<HeadersFrame>());
    case FrameType::Priority:
      return ParsePriorityFrame(header, payload, out.emplace<PriorityFrame>());
    case FrameType::RstStream:
      return ParseRstStreamFrame(header, payload, out.emplace<RstStreamFrame>());
    case FrameType::Settings:
      return ParseSettingsFrame(header, payload, out.emplace<SettingsFrame>());
    case FrameType::PushPromise:
      return ParsePushPromiseFrame(header, payload, out.emplace<PushPromiseFrame>());
    case FrameType::Ping:
      return ParsePingFrame(header, payload, out.emplace<PingFrame>());
    case FrameType::GoAway:
      return ParseGoAwayFrame(header, payload, out.emplace<GoAwayFrame>());
    case FrameType::WindowUpdate:
      return ParseWindowUpdateFrame(header, payload, out.emplace<WindowUpdateFrame>());
    case FrameType::Continuation:
      return ParseContinuationFrame(header, payload, out.emplace<ContinuationFrame>());
    default:
      out.emplace<UnknownFrame>().payload = payload;
      return {};
  }
}

// ============================
// Frame writing functions
// ============================

std::size_t BeginFrame(ByteBuffer& buffer, FrameType type, uint8_t flags, uint32_t streamId) {
  const std::size_t headerPos = buffer.size();
  buffer.ensureAvailableCapacity(FrameHeader::kSize);
  WriteFrameHeader(buffer.end(), FrameHeader{0, type, flags, streamId});
  buffer.addSize(FrameHeader::kSize);
  return headerPos;
}

std::size_t EndFrame(ByteBuffer& buffer, std::size_t headerPos) noexcept {
  const std::size_t payloadSize = buffer.size() - headerPos - FrameHeader::kSize;
  Write24BE(buffer.data() + headerPos, static_cast<uint32_t>(payloadSize));
  return payloadSize;
}

std::size_t WriteDataFrame(ByteBuffer& buffer, uint32_t streamId, std::span<const std::byte> data, bool endStream) {
  const std::size_t headerPos =
      BeginFrame(buffer, FrameType::Data, endStream ? FrameFlags::EndStream : FrameFlags::None, streamId);
  buffer.append(data);
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WriteDataFramePadded(ByteBuffer& buffer, uint32_t streamId, std::span<const std::byte> data,
                                 std::span<const std::byte> padding, bool endStream) {
  uint8_t flags = FrameFlags::Padded;
  if (endStream) {
    flags |= FrameFlags::EndStream;
  }
  const std::size_t headerPos = BeginFrame(buffer, FrameType::Data, flags, streamId);
  buffer.ensureAvailableCapacity(1 + data.size() + padding.size());
  buffer.unchecked_push_back(static_cast<std::byte>(padding.size()));
  buffer.unchecked_append(data);
  buffer.unchecked_append(padding);
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WriteHeadersFrame(ByteBuffer& buffer, const HeadersFrameParam& param) {
  uint8_t flags = FrameFlags::None;
  if (param.endStream) {
    flags |= FrameFlags::EndStream;
  }
  if (param.endHeaders) {
    flags |= FrameFlags::EndHeaders;
  }
  if (param.padLength != 0) {
    flags |= FrameFlags::Padded;
  }
  if (param.priority) {
    flags |= FrameFlags::Priority;
  }
  const std::size_t headerPos = BeginFrame(buffer, FrameType::Headers, flags, param.streamId);
  if (param.padLength != 0) {
    buffer.push_back(static_cast<std::byte>(param.padLength));
  }
  if (param.priority) {
    AppendPriority(buffer, *param.priority);
  }
  buffer.append(param.headerBlockFragment);
  buffer.append(param.padLength, std::byte{0});
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WritePriorityFrame(ByteBuffer& buffer, uint32_t streamId, PriorityParam priority) {
  const std::size_t headerPos = BeginFrame(buffer, FrameType::Priority, FrameFlags::None, streamId);
  AppendPriority(buffer, priority);
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WriteRstStreamFrame(ByteBuffer& buffer, uint32_t streamId, ErrorCode errorCode) {
  const std::size_t headerPos = BeginFrame(buffer, FrameType::RstStream, FrameFlags::None, streamId);
  buffer.ensureAvailableCapacity(4);
  Write32BE(buffer.end(), static_cast<uint32_t>(errorCode));
  buffer.addSize(4);
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WriteSettingsFrame(ByteBuffer& buffer, std::span<const SettingsEntry> entries) {
  const std::size_t headerPos = BeginFrame(buffer, FrameType::Settings, FrameFlags::None, 0);
  buffer.ensureAvailableCapacity(entries.size() * SettingsFrame::kEntrySize);
  for (const SettingsEntry& entry : entries) {
    Write16BE(buffer.end(), static_cast<uint16_t>(entry.id));
    Write32BE(buffer.end() + 2, entry.value);
    buffer.addSize(SettingsFrame::kEntrySize);
  }
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WriteSettingsAckFrame(ByteBuffer& buffer) {
  const std::size_t headerPos = BeginFrame(buffer, FrameType::Settings, FrameFlags::Ack, 0);
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WritePushPromiseFrame(ByteBuffer& buffer, const PushPromiseParam& param) {
  uint8_t flags = FrameFlags::None;
  if (param.endHeaders) {
    flags |= FrameFlags::EndHeaders;
  }
  if (param.padLength != 0) {
    flags |= FrameFlags::Padded;
  }
  const std::size_t headerPos = BeginFrame(buffer, FrameType::PushPromise, flags, param.streamId);
  buffer.ensureAvailableCapacity(5);
  if (param.padLength != 0) {
    buffer.unchecked_push_back(static_cast<std::byte>(param.padLength));
  }
  Write32BE(buffer.end(), param.promisedStreamId);
  buffer.addSize(4);
  buffer.append(param.headerBlockFragment);
  buffer.append(param.padLength, std::byte{0});
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WritePingFrame(ByteBuffer& buffer, std::span<const std::byte, 8> opaqueData, bool isAck) {
  const std::size_t headerPos =
      BeginFrame(buffer, FrameType::Ping, isAck ? FrameFlags::Ack : FrameFlags::None, 0);
  buffer.append(opaqueData);
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WriteGoAwayFrame(ByteBuffer& buffer, uint32_t lastStreamId, ErrorCode errorCode,
                             std::span<const std::byte> debugData) {
  const std::size_t headerPos = BeginFrame(buffer, FrameType::GoAway, FrameFlags::None, 0);
  buffer.ensureAvailableCapacity(8 + debugData.size());
  Write32BE(buffer.end(), lastStreamId);
  Write32BE(buffer.end() + 4, static_cast<uint32_t>(errorCode));
  buffer.addSize(8);
  buffer.unchecked_append(debugData);
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WriteWindowUpdateFrame(ByteBuffer& buffer, uint32_t streamId, uint32_t windowSizeIncrement) {
  const std::size_t headerPos = BeginFrame(buffer, FrameType::WindowUpdate, FrameFlags::None, streamId);
  buffer.ensureAvailableCapacity(4);
  Write32BE(buffer.end(), windowSizeIncrement);
  buffer.addSize(4);
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WriteContinuationFrame(ByteBuffer& buffer, uint32_t streamId, std::span<const std::byte> headerBlock,
                                   bool endHeaders) {
  const std::size_t headerPos = BeginFrame(buffer, FrameType::Continuation,
                                           endHeaders ? FrameFlags::EndHeaders : FrameFlags::None, streamId);
  buffer.append(headerBlock);
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

std::size_t WriteRawFrame(ByteBuffer& buffer, FrameType type, uint8_t flags, uint32_t streamId,
                          std::span<const std::byte> payload) {
  const std::size_t headerPos = BeginFrame(buffer, type, flags, streamId);
  buffer.append(payload);
  return FrameHeader::kSize + EndFrame(buffer, headerPos);
}

}  // namespace h2mux::http2
