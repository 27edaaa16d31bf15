#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "h2mux/byte-buffer.hpp"
#include "h2mux/http2-config.hpp"
#include "h2mux/http2-frame-types.hpp"
#include "h2mux/http2-frame.hpp"
#include "h2mux/header-block-validator.hpp"
#include "h2mux/transport.hpp"

namespace h2mux::http2 {

struct FramerOptions {
  /// Frames with a larger declared payload are rejected with FrameTooLargeError.
  uint32_t maxReadFrameSize{kDefaultMaxFrameSize};

  /// Skip header block ordering validation (conformance testing tools only).
  bool allowIllegalReads{false};

  /// Skip argument validation of write methods.
  bool allowIllegalWrites{false};

  /// Returned frames borrow the read buffer until the next readFrame() (see Frame).
  bool reuseFrames{true};

  bool logReads{false};
  bool logWrites{false};

  static FramerOptions FromConfig(const Http2Config& config) {
    FramerOptions options;
    options.maxReadFrameSize = config.maxFrameSize;
    options.allowIllegalReads = config.allowIllegalReads;
    options.allowIllegalWrites = config.allowIllegalWrites;
    options.reuseFrames = config.reuseFrames;
    options.logReads = config.logFrameReads;
    options.logWrites = config.logFrameWrites;
    return options;
  }
};

/// Reads and writes HTTP/2 frames on a transport.
///
/// One reader and one writer may use a Framer concurrently, but neither side is internally synchronized: callers
/// must serialize their own reads, and their own writes. Each write method performs exactly one transport write of
/// one complete frame.
///
/// Errors:
///  - readFrame throws ConnectionError (FrameTooLargeError for oversized frames) for connection-fatal violations,
///    StreamError for violations scoped to one stream, TransportError on transport failure or EOF.
///    errorDetail() describes the last read error.
///  - write methods throw std::invalid_argument for illegal arguments (unless allowIllegalWrites),
///    FrameTooLargeError if the payload does not fit 24 bits, TransportError if the transport write fails.
class Framer {
 public:
  explicit Framer(ITransport& transport, FramerOptions options = {});

  Framer(const Framer&) = delete;
  Framer(Framer&&) = delete;
  Framer& operator=(const Framer&) = delete;
  Framer& operator=(Framer&&) = delete;

  ~Framer();

  /// Reads the next frame. Previously returned borrowed frames expire.
  [[nodiscard]] Frame readFrame();

  /// Clamped to 2^24-1.
  void setMaxReadFrameSize(uint32_t maxSize) noexcept;

  [[nodiscard]] uint32_t maxReadFrameSize() const noexcept { return _options.maxReadFrameSize; }

  /// Detail of the last readFrame error, empty if the last read succeeded.
  [[nodiscard]] const std::string& errorDetail() const noexcept { return _errorDetail; }

  [[nodiscard]] const FramerOptions& options() const noexcept { return _options; }

  // ============================
  // Write methods
  // ============================

  void writeData(uint32_t streamId, bool endStream, std::span<const std::byte> data);

  /// DATA with the PADDED flag. Padding must be at most 255 zero bytes (unless allowIllegalWrites).
  void writeDataPadded(uint32_t streamId, bool endStream, std::span<const std::byte> data,
                       std::span<const std::byte> padding);

  void writeHeaders(const HeadersFrameParam& param);

  void writePriority(uint32_t streamId, PriorityParam priority);

  void writeRstStream(uint32_t streamId, ErrorCode code);

  void writeSettings(std::span<const SettingsEntry> entries);

  void writeSettingsAck();

  void writePushPromise(const PushPromiseParam& param);

  void writePing(bool ack, std::span<const std::byte, 8> data);

  void writeGoAway(uint32_t lastStreamId, ErrorCode code, std::span<const std::byte> debugData = {});

  /// Increment must be in [1, 2^31-1] (unless allowIllegalWrites). streamId 0 targets the connection window.
  void writeWindowUpdate(uint32_t streamId, uint32_t increment);

  void writeContinuation(uint32_t streamId, bool endHeaders, std::span<const std::byte> headerBlockFragment);

  /// Writes an arbitrary frame, without any validation of type, flags or payload.
  void writeRawFrame(FrameType type, uint8_t flags, uint32_t streamId, std::span<const std::byte> payload);

 private:
  void readExact(std::span<std::byte> buf, bool atFrameStart);

  [[noreturn]] void throwConnectionError(ErrorCode code, std::string detail);

  void checkStreamId(uint32_t streamId) const;

  // Checks the length of the frame encoded in _wbuf and writes it in one transport call.
  void endWrite();

  void logWrite() const;

  ITransport& _transport;
  FramerOptions _options;
  HeaderBlockValidator _headerBlockValidator;
  ByteBuffer _rbuf;
  ByteBuffer _wbuf;
  std::string _errorDetail;
  // Incremented at each read, so that borrowed frames can detect their expiry.
  std::shared_ptr<uint64_t> _readGeneration;
};

}  // namespace h2mux::http2
