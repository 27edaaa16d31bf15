#include "h2mux/client-connection.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "h2mux/byte-buffer.hpp"
#include "h2mux/flow-window.hpp"
#include "h2mux/header-codec.hpp"
#include "h2mux/http2-config.hpp"
#include "h2mux/http2-errors.hpp"
#include "h2mux/http2-frame-types.hpp"
#include "h2mux/http2-frame.hpp"
#include "h2mux/http2-framer.hpp"
#include "h2mux/http2-stream.hpp"
#include "h2mux/log.hpp"
#include "h2mux/transport.hpp"

namespace h2mux::http2 {

namespace {

const Http2Config& Validated(const Http2Config& config) {
  config.validate();
  return config;
}

}  // namespace

ClientConnection::ClientConnection(ITransport& transport, HeaderBlockCodec& codec, Http2Config config)
    : _config(Validated(config)),
      _transport(transport),
      _codec(codec),
      _framer(transport, FramerOptions::FromConfig(_config)),
      _connRecvWindow(static_cast<int32_t>(_config.connectionWindowSize)),
      _rng(std::random_device{}()) {}

ClientConnection::~ClientConnection() { close(); }

template <class Func>
void ClientConnection::writeFrames(std::unique_lock<std::mutex>& lock, Func&& func) {
  std::unique_lock writeLock(_wmu);
  lock.unlock();
  try {
    func(_framer);
  } catch (const TransportError& err) {
    log::error("http2: write failed: {}", err.what());
    // Unblocks the read loop, which then tears the connection down.
    _transport.shutdown();
    throw;
  }
}

void ClientConnection::start() {
  std::unique_lock lock(_mu);
  if (_started) {
    throw std::logic_error("connection already started");
  }
  throwIfClosedLocked();
  _started = true;
  ++_settingsAcksPending;

  const std::array settings{
      SettingsEntry{SettingsParameter::EnablePush, _config.enablePush ? 1U : 0U},
      SettingsEntry{SettingsParameter::InitialWindowSize, _config.initialWindowSize},
      SettingsEntry{SettingsParameter::MaxFrameSize, _config.maxFrameSize},
      SettingsEntry{SettingsParameter::MaxConcurrentStreams, _config.maxConcurrentStreams},
      SettingsEntry{SettingsParameter::HeaderTableSize, _config.headerTableSize},
      SettingsEntry{SettingsParameter::MaxHeaderListSize, _config.maxHeaderListSize},
  };
  const uint32_t connWindowIncrement = _config.connectionWindowSize - kDefaultInitialWindowSize;

  writeFrames(lock, [&](Framer& framer) {
    const auto preface = AsBytes(kClientPreface);
    const auto [bytes, status] = _transport.write(preface);
    if (status != TransportStatus::Ok || bytes != preface.size()) {
      throw TransportError("unable to write the client preface");
    }
    framer.writeSettings(settings);
    if (connWindowIncrement != 0) {
      framer.writeWindowUpdate(kConnectionStreamId, connWindowIncrement);
    }
  });

  log::debug("http2: connection started, initial window {} connection window {}", _config.initialWindowSize,
             _config.connectionWindowSize);
  _readLoop = std::jthread([this] { readLoop(); });
}

// ============================
// Streams
// ============================

uint32_t ClientConnection::openStream(std::span<const HeaderField> headers, bool endStream) {
  std::unique_lock lock(_mu);
  if (!_started) {
    throw std::logic_error("connection not started");
  }
  _cond.wait(lock, [this] {
    return _closed || _goAwayReceived || _goAwaySent ||
           activeStreamCountLocked() < _peerSettings.maxConcurrentStreams;
  });
  throwIfClosedLocked();
  if (_goAwayReceived) {
    throw GoAwayRefusedError(0, _goAwayLastStreamId, "connection received GOAWAY, no new stream can be opened");
  }
  if (_goAwaySent) {
    throw GoAwayRefusedError(0, 0, "connection is shutting down");
  }
  if (_nextStreamId > kMaxStreamId) {
    throw GoAwayRefusedError(0, kMaxStreamId, "stream identifiers exhausted");
  }

  const uint32_t streamId = _nextStreamId;
  _nextStreamId += 2;
  auto stream = std::make_shared<Http2Stream>(streamId, static_cast<int32_t>(_peerSettings.initialWindowSize),
                                              static_cast<int32_t>(_config.initialWindowSize));
  static_cast<void>(stream->onSendHeaders(endStream));
  _streams.emplace(streamId, std::move(stream));

  const std::size_t maxFrameSize = _peerSettings.maxFrameSize;
  try {
    writeFrames(lock, [&](Framer& framer) {
      _encodeBuf.clear();
      _codec.encode(headers, _encodeBuf);

      std::span<const std::byte> block = _encodeBuf;
      const std::size_t firstSize = std::min(block.size(), maxFrameSize);
      HeadersFrameParam param;
      param.streamId = streamId;
      param.headerBlockFragment = block.first(firstSize);
      param.endStream = endStream;
      param.endHeaders = firstSize == block.size();
      framer.writeHeaders(param);
      block = block.subspan(firstSize);

      while (!block.empty()) {
        const std::size_t fragmentSize = std::min(block.size(), maxFrameSize);
        framer.writeContinuation(streamId, fragmentSize == block.size(), block.first(fragmentSize));
        block = block.subspan(fragmentSize);
      }
    });
  } catch (...) {
    // Must not count against MAX_CONCURRENT_STREAMS.
    if (!lock.owns_lock()) {
      lock.lock();
    }
    _streams.erase(streamId);
    _cond.notify_all();
    throw;
  }

  log::debug("http2: opened stream {}", streamId);
  return streamId;
}

void ClientConnection::writeData(uint32_t streamId, std::span<const std::byte> data, bool endStream) {
  if (data.empty() && !endStream) {
    return;
  }
  std::unique_lock lock(_mu);
  const auto stream = streamLocked(streamId);
  while (true) {
    _cond.wait(lock, [&] {
      return _closed || stream->canceled() || stream->failure() || !stream->canSend() || data.empty() ||
             Sendable(stream->sendWindow(), _connSendWindow) > 0;
    });
    throwIfFailedLocked(*stream);
    if (!stream->canSend()) {
      throw StreamClosedError(streamId, std::format("stream {} is closed for writing", streamId));
    }

    const std::size_t chunkSize =
        std::min({data.size(), static_cast<std::size_t>(Sendable(stream->sendWindow(), _connSendWindow)),
                  static_cast<std::size_t>(_peerSettings.maxFrameSize)});
    const auto chunk = data.first(chunkSize);
    data = data.subspan(chunkSize);
    const bool last = endStream && data.empty();

    stream->sendWindow().take(static_cast<uint32_t>(chunkSize));
    _connSendWindow.take(static_cast<uint32_t>(chunkSize));
    static_cast<void>(stream->onSendData(last));

    writeFrames(lock, [&](Framer& framer) { framer.writeData(streamId, last, chunk); });
    if (data.empty()) {
      return;
    }
    lock.lock();
  }
}

HeaderList ClientConnection::awaitHeaders(uint32_t streamId) {
  std::unique_lock lock(_mu);
  const auto stream = streamLocked(streamId);
  _cond.wait(lock, [&] { return stream->headersReceived() || stream->canceled() || stream->failure() || _closed; });
  if (!stream->headersReceived()) {
    throwIfFailedLocked(*stream);
  }
  return *stream->headers();
}

std::size_t ClientConnection::readData(uint32_t streamId, std::span<std::byte> out) {
  std::unique_lock lock(_mu);
  const auto stream = streamLocked(streamId);
  if (out.empty()) {
    return 0;
  }
  _cond.wait(lock, [&] {
    return !stream->recvBuffer().empty() || stream->endStreamReceived() || stream->canceled() || stream->failure() ||
           _closed;
  });
  if (stream->canceled()) {
    throw CanceledError(streamId);
  }

  // Data received before a reset is still delivered.
  ByteBuffer& buffered = stream->recvBuffer();
  if (buffered.empty()) {
    if (stream->endStreamReceived()) {
      return 0;
    }
    throwIfFailedLocked(*stream);
  }
  const std::size_t nbRead = std::min(out.size(), buffered.size());
  std::memcpy(out.data(), buffered.data(), nbRead);
  buffered.erase_front(nbRead);

  uint32_t connIncrement = 0;
  uint32_t streamIncrement = 0;
  const auto connTarget = static_cast<int64_t>(_config.connectionWindowSize);
  if (_connRecvWindow.size() < connTarget / 2) {
    connIncrement = static_cast<uint32_t>(connTarget - _connRecvWindow.size());
    static_cast<void>(_connRecvWindow.add(connIncrement));
  }
  if (!stream->endStreamReceived() && !stream->failure()) {
    // Bytes still buffered count as granted, the application has not consumed them yet.
    const auto streamTarget = static_cast<int64_t>(_config.initialWindowSize);
    const int64_t granted = stream->recvWindow().size() + static_cast<int64_t>(buffered.size());
    if (granted < streamTarget - static_cast<int64_t>(_config.streamWindowRefreshThreshold)) {
      streamIncrement = static_cast<uint32_t>(streamTarget - granted);
      static_cast<void>(stream->recvWindow().add(streamIncrement));
    }
  }

  if ((connIncrement != 0 || streamIncrement != 0) && !_closed) {
    writeFrames(lock, [&](Framer& framer) {
      if (connIncrement != 0) {
        framer.writeWindowUpdate(kConnectionStreamId, connIncrement);
      }
      if (streamIncrement != 0) {
        framer.writeWindowUpdate(streamId, streamIncrement);
      }
    });
  }
  return nbRead;
}

std::optional<HeaderList> ClientConnection::awaitTrailers(uint32_t streamId) {
  std::unique_lock lock(_mu);
  const auto stream = streamLocked(streamId);
  _cond.wait(lock,
             [&] { return stream->endStreamReceived() || stream->canceled() || stream->failure() || _closed; });
  if (!stream->endStreamReceived()) {
    throwIfFailedLocked(*stream);
  }
  return stream->trailers();
}

void ClientConnection::cancelStream(uint32_t streamId) {
  std::unique_lock lock(_mu);
  const auto stream = findStreamLocked(streamId);
  if (!stream) {
    return;
  }
  stream->markCanceled();
  const bool sendRst = !stream->isClosed() && stream->onSendRstStream();
  const uint32_t refund = forgetStreamLocked(streamId);
  _cond.notify_all();

  log::debug("http2: stream {} canceled", streamId);
  if ((!sendRst && refund == 0) || _closed) {
    return;
  }
  writeFrames(lock, [&](Framer& framer) {
    if (sendRst) {
      framer.writeRstStream(streamId, ErrorCode::Cancel);
    }
    if (refund != 0) {
      framer.writeWindowUpdate(kConnectionStreamId, refund);
    }
  });
}

void ClientConnection::closeStream(uint32_t streamId) {
  std::unique_lock lock(_mu);
  const auto stream = findStreamLocked(streamId);
  if (!stream) {
    return;
  }
  if (!stream->isClosed()) {
    lock.unlock();
    cancelStream(streamId);
    return;
  }
  const uint32_t refund = forgetStreamLocked(streamId);
  _cond.notify_all();
  if (refund == 0 || _closed) {
    return;
  }
  writeFrames(lock, [&](Framer& framer) { framer.writeWindowUpdate(kConnectionStreamId, refund); });
}

uint32_t ClientConnection::forgetStreamLocked(uint32_t streamId) {
  auto it = _streams.find(streamId);
  if (it == _streams.end()) {
    return 0;
  }
  ByteBuffer& buffered = it->second->recvBuffer();
  const auto refund = static_cast<uint32_t>(buffered.size());
  buffered.clear();
  _streams.erase(it);
  if (refund != 0) {
    static_cast<void>(_connRecvWindow.add(refund));
  }
  return refund;
}

bool ClientConnection::resetStreamLocked(Http2Stream& stream, ErrorCode errorCode, const std::string& detail) {
  log::warn("http2: resetting stream {} with {}: {}", stream.id(), ErrorCodeName(errorCode), detail);
  stream.fail(std::make_exception_ptr(StreamError(stream.id(), errorCode, detail)));
  const bool firstReset = stream.onSendRstStream();
  _cond.notify_all();
  return firstReset && !_closed;
}

// ============================
// Connection control
// ============================

std::chrono::nanoseconds ClientConnection::ping(std::chrono::milliseconds timeout) {
  std::unique_lock lock(_mu);
  if (!_started) {
    throw std::logic_error("connection not started");
  }
  throwIfClosedLocked();

  uint64_t nonce{};
  do {
    nonce = _rng();
  } while (_pings.find(nonce) != _pings.end());
  std::array<std::byte, 8> opaqueData;
  std::memcpy(opaqueData.data(), &nonce, sizeof(nonce));

  const auto sentAt = std::chrono::steady_clock::now();
  _pings.emplace(nonce, PendingPing{sentAt, std::nullopt});
  try {
    writeFrames(lock, [&](Framer& framer) { framer.writePing(false, opaqueData); });
  } catch (const TransportError&) {
    if (!lock.owns_lock()) {
      lock.lock();
    }
    _pings.erase(nonce);
    throw;
  }

  lock.lock();
  _cond.wait_until(lock, sentAt + timeout, [&] {
    const auto it = _pings.find(nonce);
    return _closed || it->second.ackedAt.has_value();
  });
  const auto it = _pings.find(nonce);
  const auto ackedAt = it->second.ackedAt;
  _pings.erase(it);

  if (ackedAt) {
    return *ackedAt - sentAt;
  }
  throwIfClosedLocked();
  throw PingTimeoutError(std::format("no PING ACK received within {}", timeout));
}

void ClientConnection::shutdown(ErrorCode errorCode, std::string_view debugData) {
  std::unique_lock lock(_mu);
  if (_closed || _goAwaySent) {
    return;
  }
  _goAwaySent = true;
  _cond.notify_all();
  if (!_started) {
    return;
  }
  log::info("http2: sending GOAWAY {}", ErrorCodeName(errorCode));
  // We never accept streams from the server, so the last processed peer stream is always 0.
  writeFrames(lock, [&](Framer& framer) { framer.writeGoAway(0, errorCode, AsBytes(debugData)); });
}

void ClientConnection::close() {
  // Must happen before taking _mu: a write blocked on a peer that stopped reading holds _wmu, and a thread waiting
  // for _wmu may hold _mu.
  _closeRequested.store(true);
  _transport.shutdown();
  teardown(ErrorCode::NoError, "connection closed", false);
  if (_readLoop.joinable() && _readLoop.get_id() != std::this_thread::get_id()) {
    _readLoop.join();
  }
}

void ClientConnection::teardown(ErrorCode errorCode, std::string reason, bool sendGoAway) {
  std::unique_lock lock(_mu);
  if (_closed) {
    return;
  }
  _closed = true;
  _closeCode = errorCode;
  _closeReason = std::move(reason);

  const auto closedError = std::make_exception_ptr(ConnectionClosedError(_closeCode, _closeReason));
  for (auto& [streamId, stream] : _streams) {
    stream->fail(closedError);
  }
  _streams.clear();
  _cond.notify_all();

  if (sendGoAway && _started) {
    const std::string debugData = _closeReason;
    try {
      writeFrames(lock, [&](Framer& framer) { framer.writeGoAway(0, errorCode, AsBytes(debugData)); });
    } catch (const TransportError& err) {
      log::debug("http2: unable to send GOAWAY: {}", err.what());
    }
  } else {
    lock.unlock();
  }
  _transport.shutdown();
}

// ============================
// Read loop
// ============================

void ClientConnection::readLoop() {
  log::debug("http2: read loop started");
  try {
    while (true) {
      try {
        const Frame frame = _framer.readFrame();
        processFrame(frame);
      } catch (const StreamError& err) {
        handleStreamError(err.streamId(), err.code(), err.what());
      }
    }
  } catch (const ConnectionError& err) {
    log::error("http2: connection error {}: {}", ErrorCodeName(err.code()), err.what());
    teardown(err.code(), err.what(), true);
  } catch (const TransportError& err) {
    if (_closeRequested.load()) {
      teardown(ErrorCode::NoError, "connection closed", false);
    } else if (err.isEof()) {
      log::info("http2: connection closed by peer");
      teardown(ErrorCode::NoError, "connection closed by peer", false);
    } else {
      log::error("http2: transport error: {}", err.what());
      teardown(ErrorCode::InternalError, err.what(), false);
    }
  } catch (const std::exception& ex) {
    log::error("http2: read loop failed: {}", ex.what());
    teardown(ErrorCode::InternalError, ex.what(), true);
  }
  log::debug("http2: read loop stopped");
}

void ClientConnection::processFrame(const Frame& frame) {
  const FrameHeader& header = frame.header();
  switch (frame.type()) {
    case FrameType::Data:
      handleDataFrame(header, frame.get<DataFrame>());
      break;
    case FrameType::Headers:
      handleHeadersFrame(header, frame.get<HeadersFrame>());
      break;
    case FrameType::Continuation:
      handleContinuationFrame(header, frame.get<ContinuationFrame>());
      break;
    case FrameType::RstStream:
      handleRstStreamFrame(header, frame.get<RstStreamFrame>());
      break;
    case FrameType::Settings:
      handleSettingsFrame(frame.get<SettingsFrame>());
      break;
    case FrameType::Ping:
      handlePingFrame(frame.get<PingFrame>());
      break;
    case FrameType::GoAway:
      handleGoAwayFrame(frame.get<GoAwayFrame>());
      break;
    case FrameType::WindowUpdate:
      handleWindowUpdateFrame(header, frame.get<WindowUpdateFrame>());
      break;
    case FrameType::PushPromise:
      throw ConnectionError(ErrorCode::ProtocolError, "received PUSH_PROMISE although push is disabled");
    case FrameType::Priority:
      // Stream prioritization is advisory, and deprecated by RFC 9113.
      break;
    default:
      log::debug("http2: ignoring frame of unknown type {}", static_cast<uint8_t>(frame.type()));
      break;
  }
}

void ClientConnection::handleDataFrame(const FrameHeader& header, const DataFrame& frame) {
  const uint32_t streamId = header.streamId;
  // Padding counts against flow control as well.
  const uint32_t flowLength = header.length;
  const auto padding = static_cast<uint32_t>(flowLength - frame.data.size());

  std::unique_lock lock(_mu);
  if (!_connRecvWindow.consume(flowLength)) {
    throw ConnectionError(ErrorCode::FlowControlError,
                          std::format("DATA of {} bytes on stream {} overruns the connection window of {}",
                                      flowLength, streamId, _connRecvWindow.size()));
  }

  uint32_t connRefund = 0;
  uint32_t streamRefund = 0;
  bool sendRst = false;
  ErrorCode rstCode = ErrorCode::NoError;

  const auto stream = findStreamLocked(streamId);
  if (!stream) {
    if (!isLocallyOpened(streamId)) {
      throw ConnectionError(ErrorCode::ProtocolError, std::format("DATA on stream {} which was never opened", streamId));
    }
    log::debug("http2: ignoring DATA on forgotten stream {}", streamId);
    connRefund = flowLength;
  } else if (stream->didReset() || stream->resetReceived() || stream->canceled()) {
    connRefund = flowLength;
  } else {
    if (!stream->recvWindow().consume(flowLength)) {
      throw ConnectionError(ErrorCode::FlowControlError,
                            std::format("DATA of {} bytes overruns the window of stream {} ({})", flowLength,
                                        streamId, stream->recvWindow().size()));
    }
    if (!stream->headersReceived()) {
      rstCode = ErrorCode::ProtocolError;
      sendRst = resetStreamLocked(*stream, rstCode, std::format("DATA before HEADERS on stream {}", streamId));
      connRefund = flowLength;
    } else if (stream->onRecvData(frame.endStream) != ErrorCode::NoError) {
      rstCode = ErrorCode::StreamClosed;
      sendRst = resetStreamLocked(*stream, rstCode, std::format("DATA on half closed stream {}", streamId));
      connRefund = flowLength;
    } else {
      stream->recvBuffer().append(frame.data);
      if (padding != 0) {
        connRefund = padding;
        streamRefund = padding;
        static_cast<void>(stream->recvWindow().add(padding));
      }
      _cond.notify_all();
    }
  }

  if (connRefund != 0) {
    static_cast<void>(_connRecvWindow.add(connRefund));
  }
  if ((!sendRst && connRefund == 0 && streamRefund == 0) || _closed) {
    return;
  }
  writeFrames(lock, [&](Framer& framer) {
    if (sendRst) {
      framer.writeRstStream(streamId, rstCode);
    }
    if (connRefund != 0) {
      framer.writeWindowUpdate(kConnectionStreamId, connRefund);
    }
    if (streamRefund != 0) {
      framer.writeWindowUpdate(streamId, streamRefund);
    }
  });
}

void ClientConnection::handleHeadersFrame(const FrameHeader& header, const HeadersFrame& frame) {
  checkHeaderBlockSize(header.streamId, frame.headerBlockFragment.size());
  if (frame.endHeaders) {
    handleHeaderBlock(header.streamId, frame.endStream, frame.priority, frame.headerBlockFragment);
    return;
  }
  // Borrowed frame data expires at the next read, keep a copy until END_HEADERS.
  _headerBlock.streamId = header.streamId;
  _headerBlock.endStream = frame.endStream;
  _headerBlock.priority = frame.priority;
  _headerBlock.block.assign(frame.headerBlockFragment);
}

void ClientConnection::handleContinuationFrame(const FrameHeader& header, const ContinuationFrame& frame) {
  if (_headerBlock.streamId == 0 || header.streamId != _headerBlock.streamId) {
    throw ConnectionError(ErrorCode::ProtocolError,
                          std::format("CONTINUATION on stream {} outside of a header block", header.streamId));
  }
  checkHeaderBlockSize(header.streamId, _headerBlock.block.size() + frame.headerBlockFragment.size());
  _headerBlock.block.append(frame.headerBlockFragment);
  if (frame.endHeaders) {
    const uint32_t streamId = std::exchange(_headerBlock.streamId, 0);
    handleHeaderBlock(streamId, _headerBlock.endStream, _headerBlock.priority, _headerBlock.block);
    _headerBlock.block.clear();
  }
}

void ClientConnection::checkHeaderBlockSize(uint32_t streamId, std::size_t blockSize) const {
  if (blockSize > _config.maxHeaderListSize) {
    throw ConnectionError(ErrorCode::EnhanceYourCalm,
                          std::format("header block of stream {} exceeds {} bytes", streamId,
                                      _config.maxHeaderListSize));
  }
}

void ClientConnection::handleHeaderBlock(uint32_t streamId, bool endStream, std::optional<PriorityParam> priority,
                                         std::span<const std::byte> block) {
  // Always decode, the decoder context is shared by all streams.
  std::optional<HeaderList> headers = _codec.decode(block);
  if (!headers) {
    throw ConnectionError(ErrorCode::CompressionError, std::format("invalid header block on stream {}", streamId));
  }

  std::unique_lock lock(_mu);
  const auto stream = findStreamLocked(streamId);
  if (!stream) {
    if (!isLocallyOpened(streamId)) {
      throw ConnectionError(ErrorCode::ProtocolError,
                            std::format("HEADERS on stream {} which was never opened", streamId));
    }
    log::debug("http2: ignoring header block of forgotten stream {}", streamId);
    return;
  }
  if (stream->didReset() || stream->resetReceived() || stream->canceled()) {
    return;
  }

  ErrorCode rstCode = ErrorCode::NoError;
  std::string detail;
  if (priority && priority->streamDependency == streamId) {
    rstCode = ErrorCode::ProtocolError;
    detail = std::format("stream {} depends on itself", streamId);
  } else if (!stream->headersReceived()) {
    if (stream->onRecvHeaders(endStream) != ErrorCode::NoError) {
      rstCode = ErrorCode::StreamClosed;
      detail = std::format("HEADERS on closed stream {}", streamId);
    } else {
      stream->setHeaders(std::move(*headers));
    }
  } else if (stream->trailersReceived()) {
    throw ConnectionError(ErrorCode::ProtocolError, std::format("too many HEADERS frames on stream {}", streamId));
  } else if (!endStream) {
    throw ConnectionError(ErrorCode::ProtocolError,
                          std::format("trailers on stream {} without END_STREAM", streamId));
  } else if (stream->onRecvHeaders(true) != ErrorCode::NoError) {
    rstCode = ErrorCode::StreamClosed;
    detail = std::format("trailers on closed stream {}", streamId);
  } else {
    stream->setTrailers(std::move(*headers));
  }
  _cond.notify_all();

  if (rstCode != ErrorCode::NoError && resetStreamLocked(*stream, rstCode, detail)) {
    writeFrames(lock, [&](Framer& framer) { framer.writeRstStream(streamId, rstCode); });
  }
}

void ClientConnection::handleRstStreamFrame(const FrameHeader& header, const RstStreamFrame& frame) {
  const uint32_t streamId = header.streamId;
  std::unique_lock lock(_mu);
  const auto stream = findStreamLocked(streamId);
  if (!stream) {
    if (!isLocallyOpened(streamId)) {
      throw ConnectionError(ErrorCode::ProtocolError, std::format("RST_STREAM on idle stream {}", streamId));
    }
    return;
  }
  stream->onRecvRstStream(frame.errorCode);
  stream->fail(std::make_exception_ptr(StreamResetError(streamId, frame.errorCode)));
  _cond.notify_all();
  lock.unlock();

  log::debug("http2: stream {} reset by peer with {}", streamId, ErrorCodeName(frame.errorCode));
  if (_onStreamReset) {
    _onStreamReset(streamId, frame.errorCode);
  }
}

void ClientConnection::handleSettingsFrame(const SettingsFrame& frame) {
  std::unique_lock lock(_mu);
  if (frame.isAck) {
    if (_settingsAcksPending == 0) {
      throw ConnectionError(ErrorCode::ProtocolError, "received unexpected SETTINGS ACK");
    }
    --_settingsAcksPending;
    return;
  }

  std::optional<uint32_t> newHeaderTableSize;
  frame.forEach([&](SettingsEntry entry) {
    switch (entry.id) {
      case SettingsParameter::HeaderTableSize:
        _peerSettings.headerTableSize = entry.value;
        newHeaderTableSize = entry.value;
        break;
      case SettingsParameter::EnablePush:
        if (entry.value > 1) {
          throw ConnectionError(ErrorCode::ProtocolError, std::format("invalid ENABLE_PUSH value {}", entry.value));
        }
        _peerSettings.enablePush = entry.value == 1;
        break;
      case SettingsParameter::MaxConcurrentStreams:
        _peerSettings.maxConcurrentStreams = entry.value;
        break;
      case SettingsParameter::InitialWindowSize: {
        if (entry.value > kMaxWindowSize) {
          throw ConnectionError(ErrorCode::FlowControlError,
                                std::format("invalid INITIAL_WINDOW_SIZE value {}", entry.value));
        }
        // Applies to every open stream as a delta (RFC 9113 §6.9.2).
        const int64_t delta = static_cast<int64_t>(entry.value) - static_cast<int64_t>(_peerSettings.initialWindowSize);
        for (auto& [streamId, stream] : _streams) {
          if (!stream->sendWindow().add(delta)) {
            throw ConnectionError(ErrorCode::FlowControlError,
                                  std::format("INITIAL_WINDOW_SIZE change overflows the window of stream {}", streamId));
          }
        }
        _peerSettings.initialWindowSize = entry.value;
        break;
      }
      case SettingsParameter::MaxFrameSize:
        if (entry.value < kMinMaxFrameSize || entry.value > kMaxMaxFrameSize) {
          throw ConnectionError(ErrorCode::ProtocolError, std::format("invalid MAX_FRAME_SIZE value {}", entry.value));
        }
        _peerSettings.maxFrameSize = entry.value;
        break;
      case SettingsParameter::MaxHeaderListSize:
        _peerSettings.maxHeaderListSize = entry.value;
        break;
      default:
        log::warn("http2: ignoring unknown SETTINGS parameter ID {}", static_cast<uint16_t>(entry.id));
        break;
    }
  });
  _cond.notify_all();

  log::debug("http2: peer settings max concurrent streams {} initial window {} max frame size {}",
             _peerSettings.maxConcurrentStreams, _peerSettings.initialWindowSize, _peerSettings.maxFrameSize);
  writeFrames(lock, [&](Framer& framer) {
    if (newHeaderTableSize) {
      _codec.setMaxEncoderTableSize(*newHeaderTableSize);
    }
    framer.writeSettingsAck();
  });
}

void ClientConnection::handlePingFrame(const PingFrame& frame) {
  std::unique_lock lock(_mu);
  if (frame.isAck) {
    uint64_t nonce{};
    std::memcpy(&nonce, frame.opaqueData.data(), sizeof(nonce));
    const auto it = _pings.find(nonce);
    if (it == _pings.end() || it->second.ackedAt) {
      log::debug("http2: ignoring unsolicited PING ACK");
      return;
    }
    it->second.ackedAt = std::chrono::steady_clock::now();
    _cond.notify_all();
    return;
  }
  writeFrames(lock, [&](Framer& framer) { framer.writePing(true, frame.opaqueData); });
}

void ClientConnection::handleGoAwayFrame(const GoAwayFrame& frame) {
  const std::string debugData(AsStringView(frame.debugData));
  std::unique_lock lock(_mu);
  // The last stream id can only decrease across successive GOAWAY frames.
  const uint32_t lastStreamId =
      _goAwayReceived ? std::min(_goAwayLastStreamId, frame.lastStreamId) : frame.lastStreamId;
  _goAwayReceived = true;
  _goAwayLastStreamId = lastStreamId;

  for (auto& [streamId, stream] : _streams) {
    if (streamId > lastStreamId && !stream->isClosed()) {
      stream->onRefused();
      stream->fail(std::make_exception_ptr(GoAwayRefusedError(
          streamId, lastStreamId,
          std::format("stream {} not processed by peer, GOAWAY last stream id is {}", streamId, lastStreamId))));
    }
  }
  _cond.notify_all();
  lock.unlock();

  if (frame.errorCode != ErrorCode::NoError) {
    log::warn("http2: received GOAWAY last stream {} with error {}: {}", lastStreamId,
              ErrorCodeName(frame.errorCode), debugData);
  } else {
    log::info("http2: received GOAWAY last stream {}", lastStreamId);
  }
  if (_onGoAway) {
    _onGoAway(lastStreamId, frame.errorCode, debugData);
  }
}

void ClientConnection::handleWindowUpdateFrame(const FrameHeader& header, const WindowUpdateFrame& frame) {
  const uint32_t streamId = header.streamId;
  std::unique_lock lock(_mu);
  if (streamId == kConnectionStreamId) {
    if (!_connSendWindow.add(frame.windowSizeIncrement)) {
      throw ConnectionError(ErrorCode::FlowControlError,
                            std::format("WINDOW_UPDATE of {} overflows the connection window of {}",
                                        frame.windowSizeIncrement, _connSendWindow.size()));
    }
    _cond.notify_all();
    return;
  }

  const auto stream = findStreamLocked(streamId);
  if (!stream) {
    return;
  }
  if (!stream->sendWindow().add(frame.windowSizeIncrement)) {
    if (resetStreamLocked(*stream, ErrorCode::FlowControlError,
                          std::format("WINDOW_UPDATE of {} overflows the window of stream {}",
                                      frame.windowSizeIncrement, streamId))) {
      writeFrames(lock, [&](Framer& framer) { framer.writeRstStream(streamId, ErrorCode::FlowControlError); });
    }
    return;
  }
  _cond.notify_all();
}

void ClientConnection::handleStreamError(uint32_t streamId, ErrorCode errorCode, const std::string& detail) {
  std::unique_lock lock(_mu);
  const auto stream = findStreamLocked(streamId);
  if (!stream) {
    log::warn("http2: stream error on unknown stream {}: {}", streamId, detail);
    return;
  }
  if (resetStreamLocked(*stream, errorCode, detail)) {
    writeFrames(lock, [&](Framer& framer) { framer.writeRstStream(streamId, errorCode); });
  }
}

// ============================
// Helpers and observers
// ============================

void ClientConnection::throwIfClosedLocked() const {
  if (_closed) {
    throw ConnectionClosedError(_closeCode, _closeReason);
  }
}

void ClientConnection::throwIfFailedLocked(const Http2Stream& stream) const {
  if (stream.canceled()) {
    throw CanceledError(stream.id());
  }
  if (stream.failure()) {
    std::rethrow_exception(stream.failure());
  }
  throwIfClosedLocked();
}

std::shared_ptr<Http2Stream> ClientConnection::findStreamLocked(uint32_t streamId) const {
  const auto it = _streams.find(streamId);
  return it == _streams.end() ? nullptr : it->second;
}

std::shared_ptr<Http2Stream> ClientConnection::streamLocked(uint32_t streamId) const {
  auto stream = findStreamLocked(streamId);
  if (!stream) {
    throwIfClosedLocked();
    throw StreamClosedError(streamId, std::format("unknown stream {}", streamId));
  }
  return stream;
}

std::size_t ClientConnection::activeStreamCountLocked() const noexcept {
  return static_cast<std::size_t>(std::count_if(_streams.begin(), _streams.end(),
                                                [](const auto& entry) { return !entry.second->isClosed(); }));
}

PeerSettings ClientConnection::peerSettings() const {
  std::lock_guard lock(_mu);
  return _peerSettings;
}

int32_t ClientConnection::connectionSendWindow() const {
  std::lock_guard lock(_mu);
  return _connSendWindow.size();
}

int32_t ClientConnection::connectionRecvWindow() const {
  std::lock_guard lock(_mu);
  return _connRecvWindow.size();
}

std::optional<int32_t> ClientConnection::streamSendWindow(uint32_t streamId) const {
  std::lock_guard lock(_mu);
  const auto stream = findStreamLocked(streamId);
  if (!stream) {
    return std::nullopt;
  }
  return stream->sendWindow().size();
}

std::size_t ClientConnection::activeStreamCount() const {
  std::lock_guard lock(_mu);
  return activeStreamCountLocked();
}

std::size_t ClientConnection::pendingPingCount() const {
  std::lock_guard lock(_mu);
  return _pings.size();
}

bool ClientConnection::isClosed() const {
  std::lock_guard lock(_mu);
  return _closed;
}

bool ClientConnection::goAwayReceived() const {
  std::lock_guard lock(_mu);
  return _goAwayReceived;
}

uint32_t ClientConnection::nextStreamId() const {
  std::lock_guard lock(_mu);
  return _nextStreamId;
}

}  // namespace h2mux::http2
