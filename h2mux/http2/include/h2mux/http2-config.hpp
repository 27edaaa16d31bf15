#pragma once

#include <chrono>
#include <cstdint>

namespace h2mux::http2 {

/// HTTP/2 client connection configuration.
///
/// Holds the SETTINGS we advertise, our receive windows, and debugging switches of the frame layer.
/// Defaults favour throughput: large windows so that a single stream is rarely throttled by flow control.
struct Http2Config {
  // ============================
  // Advertised SETTINGS parameters
  // ============================

  /// SETTINGS_HEADER_TABLE_SIZE (0x1): Maximum size of the decoder dynamic table.
  /// Default: 4096 bytes (RFC 9113 default).
  uint32_t headerTableSize{4096};

  /// SETTINGS_ENABLE_PUSH (0x2). Server push is always refused, a received PUSH_PROMISE is a connection error.
  /// validate() rejects true. Default: false.
  bool enablePush{false};

  /// SETTINGS_MAX_CONCURRENT_STREAMS (0x3): streams the peer may open towards us.
  /// Default: 100.
  uint32_t maxConcurrentStreams{100};

  /// SETTINGS_INITIAL_WINDOW_SIZE (0x4): receive window of each stream.
  /// Default: 4 MiB.
  uint32_t initialWindowSize{4U << 20};

  /// SETTINGS_MAX_FRAME_SIZE (0x5): largest frame payload we accept.
  /// Range: 16384 (2^14) to 16777215 (2^24 - 1). Default: 16384.
  uint32_t maxFrameSize{16384};

  /// SETTINGS_MAX_HEADER_LIST_SIZE (0x6): advisory limit of uncompressed header lists.
  /// A received header block (HEADERS plus CONTINUATION fragments) larger than this is a connection
  /// ENHANCE_YOUR_CALM error. Default: 10 MiB.
  uint32_t maxHeaderListSize{10U << 20};

  // ============================
  // Connection-level settings
  // ============================

  /// Connection receive window. A WINDOW_UPDATE sent right after the preface raises the 65535 protocol default to
  /// this value. Default: 1 GiB.
  uint32_t connectionWindowSize{1U << 30};

  /// Minimum WINDOW_UPDATE increment granted to a stream as the application consumes its data.
  /// Default: 4 KiB.
  uint32_t streamWindowRefreshThreshold{4U << 10};

  /// Default timeout of ClientConnection::ping().
  std::chrono::milliseconds pingTimeout{std::chrono::seconds{15}};

  // ============================
  // Frame layer switches
  // ============================

  /// Disables frame ordering validation. Only for conformance testing tools.
  bool allowIllegalReads{false};

  /// Permits writing non-conforming frames (invalid stream ids, non-zero padding...).
  bool allowIllegalWrites{false};

  /// Frames returned by the Framer borrow its read buffer and expire at the next read.
  /// When false each frame owns a copy of its payload.
  bool reuseFrames{true};

  /// Log every frame read / written at debug level.
  bool logFrameReads{false};
  bool logFrameWrites{false};

  // ============================
  // Builder-style setters
  // ============================

  Http2Config& withHeaderTableSize(uint32_t size) {
    headerTableSize = size;
    return *this;
  }

  Http2Config& withMaxConcurrentStreams(uint32_t maxStreams) {
    maxConcurrentStreams = maxStreams;
    return *this;
  }

  Http2Config& withInitialWindowSize(uint32_t size) {
    initialWindowSize = size;
    return *this;
  }

  Http2Config& withMaxFrameSize(uint32_t size) {
    maxFrameSize = size;
    return *this;
  }

  Http2Config& withMaxHeaderListSize(uint32_t size) {
    maxHeaderListSize = size;
    return *this;
  }

  Http2Config& withConnectionWindowSize(uint32_t size) {
    connectionWindowSize = size;
    return *this;
  }

  Http2Config& withStreamWindowRefreshThreshold(uint32_t threshold) {
    streamWindowRefreshThreshold = threshold;
    return *this;
  }

  Http2Config& withPingTimeout(std::chrono::milliseconds timeout) {
    pingTimeout = timeout;
    return *this;
  }

  Http2Config& withAllowIllegalReads(bool allow) {
    allowIllegalReads = allow;
    return *this;
  }

  Http2Config& withAllowIllegalWrites(bool allow) {
    allowIllegalWrites = allow;
    return *this;
  }

  Http2Config& withReuseFrames(bool reuse) {
    reuseFrames = reuse;
    return *this;
  }

  Http2Config& withFrameLogging(bool reads, bool writes) {
    logFrameReads = reads;
    logFrameWrites = writes;
    return *this;
  }

  /// Validates the configuration.
  /// Throws std::invalid_argument if any setting is out of valid range.
  void validate() const;
};

}  // namespace h2mux::http2
