#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <thread>

#include "h2mux/byte-buffer.hpp"
#include "h2mux/flat-hash-map.hpp"
#include "h2mux/flow-window.hpp"
#include "h2mux/header-codec.hpp"
#include "h2mux/http2-config.hpp"
#include "h2mux/http2-frame-types.hpp"
#include "h2mux/http2-frame.hpp"
#include "h2mux/http2-framer.hpp"
#include "h2mux/http2-stream.hpp"
#include "h2mux/transport.hpp"

namespace h2mux::http2 {

/// Settings announced by the server, RFC 9113 defaults until its first SETTINGS frame arrives.
struct PeerSettings {
  uint32_t headerTableSize{kDefaultHeaderTableSize};
  // Unbounded per RFC until advertised, 1000 is high enough in practice.
  uint32_t maxConcurrentStreams{1000};
  uint32_t initialWindowSize{kDefaultInitialWindowSize};
  uint32_t maxFrameSize{kDefaultMaxFrameSize};
  uint32_t maxHeaderListSize{std::numeric_limits<uint32_t>::max()};
  bool enablePush{true};
};

/// Client side of an HTTP/2 connection multiplexing streams over one transport.
///
/// A dedicated read loop thread (launched by start()) reads frames and routes them to streams, while any number of
/// application threads open streams, send data and wait for responses.
///
/// Synchronization: _mu guards the connection state (stream map, windows, settings, pings), _wmu serializes frame
/// writes and the header encoder. When both are needed _mu is acquired first.
///
/// Errors seen by callers:
///  - ConnectionClosedError once the connection is closed, carrying the terminal code and reason
///  - GoAwayRefusedError for streams refused because of a GOAWAY
///  - StreamResetError when the peer reset the stream, StreamError when we reset it after a stream error
///  - CanceledError for operations on a cancelled stream
///  - TransportError when a write fails (the connection is then torn down)
class ClientConnection {
 public:
  using GoAwayCallback = std::function<void(uint32_t lastStreamId, ErrorCode errorCode, std::string_view debugData)>;
  using StreamResetCallback = std::function<void(uint32_t streamId, ErrorCode errorCode)>;

  /// The transport and the codec must outlive the connection.
  /// Throws std::invalid_argument if the configuration is invalid.
  ClientConnection(ITransport& transport, HeaderBlockCodec& codec, Http2Config config = {});

  ClientConnection(const ClientConnection&) = delete;
  ClientConnection(ClientConnection&&) = delete;
  ClientConnection& operator=(const ClientConnection&) = delete;
  ClientConnection& operator=(ClientConnection&&) = delete;

  /// Closes the connection and joins the read loop.
  ~ClientConnection();

  /// Callbacks are invoked from the read loop, without any lock held. Set them before start().
  void setOnGoAway(GoAwayCallback callback) { _onGoAway = std::move(callback); }
  void setOnStreamReset(StreamResetCallback callback) { _onStreamReset = std::move(callback); }

  /// Writes the client preface, our SETTINGS and the connection WINDOW_UPDATE, then launches the read loop.
  void start();

  /// Opens a new stream by sending its request headers. Blocks while the peer's MAX_CONCURRENT_STREAMS is reached.
  /// Returns the new stream id.
  uint32_t openStream(std::span<const HeaderField> headers, bool endStream);

  /// Sends 'data' on the stream, blocking while flow control windows are exhausted.
  void writeData(uint32_t streamId, std::span<const std::byte> data, bool endStream);

  /// Waits for the response headers of the stream.
  [[nodiscard]] HeaderList awaitHeaders(uint32_t streamId);

  /// Reads buffered response data into 'out', waiting for some if none is available.
  /// Returns 0 once the peer ended the stream and everything was read.
  std::size_t readData(uint32_t streamId, std::span<std::byte> out);

  /// Waits until the peer ended its side. Returns the trailers, or std::nullopt if the response had none.
  [[nodiscard]] std::optional<HeaderList> awaitTrailers(uint32_t streamId);

  /// Resets the stream with CANCEL (at most once) and forgets it. Pending operations fail with CanceledError.
  /// No-op for an unknown stream.
  void cancelStream(uint32_t streamId);

  /// Forgets a finished stream, or cancels it if it is not finished yet.
  void closeStream(uint32_t streamId);

  /// Sends a PING and waits for its ACK. Returns the measured round trip time.
  /// Throws PingTimeoutError if no ACK arrives within 'timeout'.
  std::chrono::nanoseconds ping(std::chrono::milliseconds timeout);

  /// Same, with the configured ping timeout.
  std::chrono::nanoseconds ping() { return ping(_config.pingTimeout); }

  /// Sends GOAWAY and stops opening new streams. Existing streams continue.
  void shutdown(ErrorCode errorCode = ErrorCode::NoError, std::string_view debugData = {});

  /// Shuts the transport down, joins the read loop and fails all pending operations. Idempotent.
  void close();

  // ============================
  // Observers
  // ============================

  [[nodiscard]] PeerSettings peerSettings() const;

  [[nodiscard]] int32_t connectionSendWindow() const;

  [[nodiscard]] int32_t connectionRecvWindow() const;

  /// std::nullopt for an unknown stream.
  [[nodiscard]] std::optional<int32_t> streamSendWindow(uint32_t streamId) const;

  /// Number of known streams that are not closed.
  [[nodiscard]] std::size_t activeStreamCount() const;

  /// PINGs sent by ping() and still waiting for their ACK.
  [[nodiscard]] std::size_t pendingPingCount() const;

  [[nodiscard]] bool isClosed() const;

  [[nodiscard]] bool goAwayReceived() const;

  [[nodiscard]] uint32_t nextStreamId() const;

  [[nodiscard]] const Http2Config& config() const noexcept { return _config; }

 private:
  struct PendingPing {
    std::chrono::steady_clock::time_point sentAt;
    std::optional<std::chrono::steady_clock::time_point> ackedAt;
  };

  // Header block being reassembled from HEADERS + CONTINUATION frames. Read loop only.
  struct HeaderBlockAssembly {
    ByteBuffer block;
    std::optional<PriorityParam> priority;
    uint32_t streamId{};
    bool endStream{false};
  };

  void readLoop();

  void processFrame(const Frame& frame);

  void handleDataFrame(const FrameHeader& header, const DataFrame& frame);
  void handleHeadersFrame(const FrameHeader& header, const HeadersFrame& frame);
  void handleContinuationFrame(const FrameHeader& header, const ContinuationFrame& frame);
  // Throws ENHANCE_YOUR_CALM once a received header block exceeds the configured max header list size.
  void checkHeaderBlockSize(uint32_t streamId, std::size_t blockSize) const;
  void handleHeaderBlock(uint32_t streamId, bool endStream, std::optional<PriorityParam> priority,
                         std::span<const std::byte> block);
  void handleRstStreamFrame(const FrameHeader& header, const RstStreamFrame& frame);
  void handleSettingsFrame(const SettingsFrame& frame);
  void handlePingFrame(const PingFrame& frame);
  void handleGoAwayFrame(const GoAwayFrame& frame);
  void handleWindowUpdateFrame(const FrameHeader& header, const WindowUpdateFrame& frame);

  // Resets a stream after a stream error detected by the Framer.
  void handleStreamError(uint32_t streamId, ErrorCode errorCode, const std::string& detail);

  // Marks the connection closed and fails every waiter. Sends a best effort GOAWAY for connection errors.
  void teardown(ErrorCode errorCode, std::string reason, bool sendGoAway);

  // Acquires the write lock while 'lock' (on _mu) is held, releases 'lock', then runs func(_framer).
  // 'lock' is left unlocked.
  template <class Func>
  void writeFrames(std::unique_lock<std::mutex>& lock, Func&& func);

  // Marks the stream reset with 'errorCode'. Returns true if RST_STREAM must be written by the caller.
  bool resetStreamLocked(Http2Stream& stream, ErrorCode errorCode, const std::string& detail);

  // Removes the stream from the map and returns to the connection window the buffered bytes never read.
  // Returns the amount refunded.
  uint32_t forgetStreamLocked(uint32_t streamId);

  // Throws if the stream can no longer make progress.
  void throwIfFailedLocked(const Http2Stream& stream) const;

  void throwIfClosedLocked() const;

  std::shared_ptr<Http2Stream> findStreamLocked(uint32_t streamId) const;

  // Throws StreamClosedError for an unknown stream.
  std::shared_ptr<Http2Stream> streamLocked(uint32_t streamId) const;

  [[nodiscard]] bool isLocallyOpened(uint32_t streamId) const noexcept {
    return IsClientStream(streamId) && streamId < _nextStreamId;
  }

  [[nodiscard]] std::size_t activeStreamCountLocked() const noexcept;

  Http2Config _config;
  ITransport& _transport;
  HeaderBlockCodec& _codec;
  Framer _framer;

  mutable std::mutex _mu;
  std::condition_variable _cond;
  std::mutex _wmu;

  // Guarded by _mu
  flat_hash_map<uint32_t, std::shared_ptr<Http2Stream>> _streams;
  flat_hash_map<uint64_t, PendingPing> _pings;
  PeerSettings _peerSettings;
  FlowWindow _connSendWindow;
  FlowWindow _connRecvWindow;
  std::mt19937_64 _rng;
  std::string _closeReason;
  uint32_t _nextStreamId{1};
  uint32_t _goAwayLastStreamId{0};
  uint32_t _settingsAcksPending{0};
  ErrorCode _closeCode{ErrorCode::NoError};
  bool _started{false};
  bool _closed{false};
  bool _goAwayReceived{false};
  bool _goAwaySent{false};

  // Set by close() before the transport is shut down, read without lock by the read loop.
  std::atomic<bool> _closeRequested{false};

  // Guarded by _wmu
  ByteBuffer _encodeBuf;

  // Read loop only
  HeaderBlockAssembly _headerBlock;

  GoAwayCallback _onGoAway;
  StreamResetCallback _onStreamReset;

  std::jthread _readLoop;
};

}  // namespace h2mux::http2
