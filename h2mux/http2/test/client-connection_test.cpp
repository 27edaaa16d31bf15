#include "h2mux/client-connection.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "h2mux/byte-buffer.hpp"
#include "h2mux/fake-peer.hpp"
#include "h2mux/header-codec.hpp"
#include "h2mux/http2-config.hpp"
#include "h2mux/http2-errors.hpp"
#include "h2mux/http2-frame-types.hpp"
#include "h2mux/http2-frame.hpp"
#include "h2mux/literal-header-codec.hpp"
#include "h2mux/socket-pair.hpp"

namespace h2mux::http2 {

using namespace std::chrono_literals;

namespace {

const HeaderList kRequest{{":method", "GET"}, {":scheme", "http"}, {":path", "/"}, {":authority", "localhost"}};
const HeaderList kResponse{{":status", "200"}, {"content-type", "text/plain"}};

template <class Pred>
bool Eventually(Pred pred, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

// Literal codec whose encoder can be made to fail.
class FailingEncoderCodec : public test::LiteralHeaderCodec {
 public:
  void encode(std::span<const HeaderField> headers, ByteBuffer& out) override {
    if (failEncode) {
      throw std::runtime_error("header encoding failed");
    }
    test::LiteralHeaderCodec::encode(headers, out);
  }

  std::atomic<bool> failEncode{false};
};

std::string ReadAll(ClientConnection& connection, uint32_t streamId) {
  std::string body;
  std::array<std::byte, 4096> buf;
  while (const std::size_t nbRead = connection.readData(streamId, buf)) {
    body.append(AsStringView(std::span<const std::byte>(buf).first(nbRead)));
  }
  return body;
}

}  // namespace

class ClientConnectionTest : public ::testing::Test {
 protected:
  // Starts the client and completes the SETTINGS exchange. Returns once the client acknowledged serverSettings.
  void startConnection(Http2Config config = {}, std::span<const SettingsEntry> serverSettings = {}) {
    connection.emplace(sockets.client(), codec, config);
    connection->start();
    peer.handshake(serverSettings);
    expectSettingsAck();
  }

  void expectSettingsAck() {
    const Frame ack = peer.expectFrame(FrameType::Settings);
    ASSERT_TRUE(ack.get<SettingsFrame>().isAck);
  }

  void expectGoAway(ErrorCode errorCode) {
    const Frame goAway = peer.expectFrame(FrameType::GoAway);
    EXPECT_EQ(goAway.get<GoAwayFrame>().errorCode, errorCode);
    EXPECT_EQ(goAway.get<GoAwayFrame>().lastStreamId, 0U);
    EXPECT_TRUE(Eventually([this] { return connection->isClosed(); }));
  }

  // Opens a stream and consumes its HEADERS on the peer side.
  uint32_t openStream(bool endStream = false) {
    const uint32_t streamId = connection->openStream(kRequest, endStream);
    const Frame headers = peer.expectFrame(FrameType::Headers);
    EXPECT_EQ(headers.streamId(), streamId);
    return streamId;
  }

  test::SocketPair sockets;
  FailingEncoderCodec codec;
  test::FakePeer peer{sockets.server()};
  std::optional<ClientConnection> connection;
};

// ============================
// Handshake and settings
// ============================

TEST_F(ClientConnectionTest, HandshakeAdvertisesSettingsAndConnectionWindow) {
  connection.emplace(sockets.client(), codec, Http2Config{}.withMaxConcurrentStreams(50));
  connection->start();
  const std::array serverSettings{SettingsEntry{SettingsParameter::MaxFrameSize, 32768},
                                  SettingsEntry{SettingsParameter::HeaderTableSize, 8192},
                                  SettingsEntry{static_cast<SettingsParameter>(0x77), 1}};
  peer.handshake(serverSettings);

  const auto& clientSettings = peer.clientSettings();
  EXPECT_NE(std::ranges::find(clientSettings, SettingsEntry{SettingsParameter::EnablePush, 0}), clientSettings.end());
  EXPECT_NE(std::ranges::find(clientSettings, SettingsEntry{SettingsParameter::InitialWindowSize, 4U << 20}),
            clientSettings.end());
  EXPECT_NE(std::ranges::find(clientSettings, SettingsEntry{SettingsParameter::MaxConcurrentStreams, 50}),
            clientSettings.end());

  const Frame windowUpdate = peer.readFrame();
  ASSERT_EQ(windowUpdate.type(), FrameType::WindowUpdate);
  EXPECT_EQ(windowUpdate.streamId(), 0U);
  EXPECT_EQ(windowUpdate.get<WindowUpdateFrame>().windowSizeIncrement, (1U << 30) - 65535U);

  expectSettingsAck();
  const PeerSettings settings = connection->peerSettings();
  EXPECT_EQ(settings.maxFrameSize, 32768U);
  EXPECT_EQ(settings.headerTableSize, 8192U);
  EXPECT_EQ(codec.maxEncoderTableSize(), 8192U);
  EXPECT_EQ(connection->connectionRecvWindow(), 1 << 30);
  EXPECT_EQ(connection->connectionSendWindow(), 65535);
  EXPECT_FALSE(connection->isClosed());
}

TEST_F(ClientConnectionTest, InvalidConfigIsRejected) {
  EXPECT_THROW(ClientConnection(sockets.client(), codec, Http2Config{}.withMaxFrameSize(100)), std::invalid_argument);
}

TEST_F(ClientConnectionTest, OperationsBeforeStartAreRejected) {
  connection.emplace(sockets.client(), codec);
  EXPECT_THROW(connection->openStream(kRequest, true), std::logic_error);
  EXPECT_THROW(connection->ping(10ms), std::logic_error);
}

TEST_F(ClientConnectionTest, InitialWindowSizeChangeAppliesDeltaToOpenStreams) {
  startConnection();
  const uint32_t streamId = openStream();
  EXPECT_EQ(connection->streamSendWindow(streamId), 65535);

  const std::array body = std::array<std::byte, 600>{};
  connection->writeData(streamId, body, false);
  EXPECT_EQ(connection->streamSendWindow(streamId), 65535 - 600);

  const std::array lower{SettingsEntry{SettingsParameter::InitialWindowSize, 1000}};
  peer.framer().writeSettings(lower);
  expectSettingsAck();
  EXPECT_EQ(connection->streamSendWindow(streamId), 400);
  // The connection window is not affected by SETTINGS.
  EXPECT_EQ(connection->connectionSendWindow(), 65535 - 600);

  const uint32_t otherStreamId = openStream();
  EXPECT_EQ(connection->streamSendWindow(otherStreamId), 1000);
}

TEST_F(ClientConnectionTest, UnexpectedSettingsAckIsConnectionError) {
  startConnection();
  peer.framer().writeSettingsAck();
  expectGoAway(ErrorCode::ProtocolError);
}

TEST_F(ClientConnectionTest, InvalidEnablePushIsConnectionError) {
  startConnection();
  const std::array invalid{SettingsEntry{SettingsParameter::EnablePush, 2}};
  peer.framer().writeSettings(invalid);
  expectGoAway(ErrorCode::ProtocolError);
}

// ============================
// Request / response
// ============================

TEST_F(ClientConnectionTest, RequestResponse) {
  startConnection();
  const uint32_t streamId = connection->openStream(kRequest, true);
  EXPECT_EQ(streamId, 1U);
  EXPECT_EQ(connection->nextStreamId(), 3U);

  const Frame headers = peer.expectFrame(FrameType::Headers);
  EXPECT_TRUE(headers.get<HeadersFrame>().endStream);
  EXPECT_TRUE(headers.get<HeadersFrame>().endHeaders);
  EXPECT_EQ(peer.decodeHeaders(headers), kRequest);

  peer.writeHeaders(streamId, kResponse, false);
  peer.framer().writeData(streamId, false, AsBytes("hello "));
  peer.framer().writeData(streamId, true, AsBytes("world"));

  EXPECT_EQ(connection->awaitHeaders(streamId), kResponse);
  EXPECT_EQ(ReadAll(*connection, streamId), "hello world");
  EXPECT_EQ(connection->awaitTrailers(streamId), std::nullopt);
  EXPECT_EQ(connection->activeStreamCount(), 0U);

  connection->closeStream(streamId);
  EXPECT_EQ(connection->streamSendWindow(streamId), std::nullopt);
  EXPECT_THROW(static_cast<void>(connection->awaitHeaders(streamId)), StreamClosedError);
}

TEST_F(ClientConnectionTest, RequestBody) {
  startConnection();
  const uint32_t streamId = openStream();
  connection->writeData(streamId, AsBytes("request body"), true);

  const Frame data = peer.expectFrame(FrameType::Data);
  EXPECT_EQ(AsStringView(data.get<DataFrame>().data), "request body");
  EXPECT_TRUE(data.get<DataFrame>().endStream);
  EXPECT_EQ(connection->connectionSendWindow(), 65535 - 12);

  EXPECT_THROW(connection->writeData(streamId, AsBytes("more"), false), StreamClosedError);
}

TEST_F(ClientConnectionTest, Trailers) {
  startConnection();
  const uint32_t streamId = openStream(true);
  const HeaderList trailers{{"grpc-status", "0"}};
  peer.writeHeaders(streamId, kResponse, false);
  peer.framer().writeData(streamId, false, AsBytes("body"));
  peer.writeHeaders(streamId, trailers, true);

  EXPECT_EQ(connection->awaitHeaders(streamId), kResponse);
  EXPECT_EQ(connection->awaitTrailers(streamId), trailers);
  EXPECT_EQ(ReadAll(*connection, streamId), "body");
}

TEST_F(ClientConnectionTest, TrailersWithoutEndStreamAreConnectionError) {
  startConnection();
  const uint32_t streamId = openStream(true);
  peer.writeHeaders(streamId, kResponse, false);
  peer.writeHeaders(streamId, kResponse, false);
  expectGoAway(ErrorCode::ProtocolError);
  EXPECT_THROW(static_cast<void>(connection->awaitHeaders(streamId)), ConnectionClosedError);
}

TEST_F(ClientConnectionTest, EncoderFailureDoesNotLeakStream) {
  const std::array serverSettings{SettingsEntry{SettingsParameter::MaxConcurrentStreams, 1}};
  startConnection({}, serverSettings);

  codec.failEncode = true;
  EXPECT_THROW(connection->openStream(kRequest, true), std::runtime_error);
  EXPECT_EQ(connection->activeStreamCount(), 0U);
  EXPECT_EQ(connection->streamSendWindow(1), std::nullopt);

  // The single stream slot is still available.
  codec.failEncode = false;
  EXPECT_EQ(openStream(true), 3U);
  EXPECT_EQ(connection->activeStreamCount(), 1U);
}

TEST_F(ClientConnectionTest, LargeRequestHeadersAreSplitIntoContinuations) {
  startConnection();
  HeaderList request = kRequest;
  request.push_back({"x-large", std::string(40000, 'a')});
  const uint32_t streamId = connection->openStream(request, true);

  ByteBuffer block;
  Frame frame = peer.expectFrame(FrameType::Headers);
  EXPECT_EQ(frame.header().length, kDefaultMaxFrameSize);
  EXPECT_FALSE(frame.get<HeadersFrame>().endHeaders);
  EXPECT_TRUE(frame.get<HeadersFrame>().endStream);
  block.append(frame.get<HeadersFrame>().headerBlockFragment);
  int nbContinuations = 0;
  bool endHeaders = false;
  while (!endHeaders) {
    frame = peer.readFrame();
    ASSERT_EQ(frame.type(), FrameType::Continuation);
    EXPECT_EQ(frame.streamId(), streamId);
    block.append(frame.get<ContinuationFrame>().headerBlockFragment);
    endHeaders = frame.get<ContinuationFrame>().endHeaders;
    ++nbContinuations;
  }
  EXPECT_EQ(nbContinuations, 2);
  EXPECT_EQ(test::LiteralHeaderCodec{}.decode(block), request);
}

TEST_F(ClientConnectionTest, ResponseHeadersWithContinuation) {
  startConnection();
  const uint32_t streamId = openStream(true);
  const ByteBuffer block = test::LiteralHeaderCodec::Encode(kResponse);
  const auto fragment = block.span();

  HeadersFrameParam param;
  param.streamId = streamId;
  param.headerBlockFragment = fragment.first(5);
  param.endStream = true;
  peer.framer().writeHeaders(param);
  peer.framer().writeContinuation(streamId, false, fragment.subspan(5, 5));
  peer.framer().writeContinuation(streamId, true, fragment.subspan(10));

  EXPECT_EQ(connection->awaitHeaders(streamId), kResponse);
  EXPECT_EQ(ReadAll(*connection, streamId), "");
}

TEST_F(ClientConnectionTest, OversizedHeaderBlockIsConnectionError) {
  startConnection(Http2Config{}.withMaxHeaderListSize(1024));
  const uint32_t streamId = openStream(true);
  const std::vector<std::byte> fragment(600);
  HeadersFrameParam param;
  param.streamId = streamId;
  param.headerBlockFragment = fragment;
  peer.framer().writeHeaders(param);
  peer.framer().writeContinuation(streamId, false, fragment);

  expectGoAway(ErrorCode::EnhanceYourCalm);
  EXPECT_THROW(static_cast<void>(connection->awaitHeaders(streamId)), ConnectionClosedError);
}

TEST_F(ClientConnectionTest, OversizedSingleHeadersFrameIsConnectionError) {
  startConnection(Http2Config{}.withMaxHeaderListSize(100));
  const uint32_t streamId = openStream(true);
  const std::vector<std::byte> block(101);
  HeadersFrameParam param;
  param.streamId = streamId;
  param.headerBlockFragment = block;
  param.endHeaders = true;
  peer.framer().writeHeaders(param);
  expectGoAway(ErrorCode::EnhanceYourCalm);
}

TEST_F(ClientConnectionTest, HeadersPriorityOnItselfResetsStream) {
  startConnection();
  const uint32_t streamId = openStream(true);
  const ByteBuffer block = test::LiteralHeaderCodec::Encode(kResponse);
  HeadersFrameParam param;
  param.streamId = streamId;
  param.headerBlockFragment = block;
  param.priority = PriorityParam{streamId, 16, false};
  param.endHeaders = true;
  peer.framer().writeHeaders(param);

  const Frame rst = peer.expectFrame(FrameType::RstStream);
  EXPECT_EQ(rst.streamId(), streamId);
  EXPECT_EQ(rst.get<RstStreamFrame>().errorCode, ErrorCode::ProtocolError);
  try {
    static_cast<void>(connection->awaitHeaders(streamId));
    FAIL() << "expected a stream error";
  } catch (const StreamError& err) {
    EXPECT_EQ(err.streamId(), streamId);
    EXPECT_EQ(err.code(), ErrorCode::ProtocolError);
  }
  EXPECT_FALSE(connection->isClosed());
}

// ============================
// Flow control
// ============================

TEST_F(ClientConnectionTest, WriteBlocksUntilWindowUpdate) {
  const std::array serverSettings{SettingsEntry{SettingsParameter::InitialWindowSize, 1000}};
  startConnection({}, serverSettings);
  const uint32_t streamId = openStream();
  EXPECT_EQ(connection->streamSendWindow(streamId), 1000);

  std::atomic<bool> done{false};
  const std::array body = std::array<std::byte, 1024>{};
  std::jthread writer([&] {
    connection->writeData(streamId, body, true);
    done = true;
  });

  const Frame first = peer.expectFrame(FrameType::Data);
  EXPECT_EQ(first.get<DataFrame>().data.size(), 1000U);
  EXPECT_FALSE(first.get<DataFrame>().endStream);
  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(done);
  EXPECT_EQ(connection->streamSendWindow(streamId), 0);

  peer.framer().writeWindowUpdate(streamId, 24);
  const Frame second = peer.expectFrame(FrameType::Data);
  EXPECT_EQ(second.get<DataFrame>().data.size(), 24U);
  EXPECT_TRUE(second.get<DataFrame>().endStream);
  writer.join();
  EXPECT_TRUE(done);
}

TEST_F(ClientConnectionTest, WriteBlockedByConnectionWindow) {
  startConnection();
  const uint32_t streamId = openStream();
  const std::vector<std::byte> body(70000);

  std::jthread writer([&] { connection->writeData(streamId, body, true); });
  std::size_t received = 0;
  while (received < 65535) {
    received += peer.expectFrame(FrameType::Data).get<DataFrame>().data.size();
  }
  EXPECT_EQ(received, 65535U);
  EXPECT_TRUE(Eventually([this] { return connection->connectionSendWindow() == 0; }));

  peer.framer().writeWindowUpdate(streamId, 100000);
  peer.framer().writeWindowUpdate(0, 100000);
  while (received < body.size()) {
    received += peer.expectFrame(FrameType::Data).get<DataFrame>().data.size();
  }
  writer.join();
  EXPECT_EQ(connection->connectionSendWindow(), 65535 + 100000 - 70000);
}

TEST_F(ClientConnectionTest, ReadingReplenishesStreamWindow) {
  startConnection(Http2Config{}.withInitialWindowSize(65535));
  const uint32_t streamId = openStream(true);
  peer.writeHeaders(streamId, kResponse, false);
  const std::vector<std::byte> body(10000, std::byte{'b'});
  peer.framer().writeData(streamId, false, body);

  EXPECT_EQ(connection->awaitHeaders(streamId), kResponse);
  std::vector<std::byte> out(body.size());
  std::size_t nbRead = 0;
  while (nbRead < out.size()) {
    nbRead += connection->readData(streamId, std::span(out).subspan(nbRead));
  }

  const Frame update = peer.expectFrame(FrameType::WindowUpdate);
  EXPECT_EQ(update.streamId(), streamId);
  EXPECT_EQ(update.get<WindowUpdateFrame>().windowSizeIncrement, 10000U);
}

TEST_F(ClientConnectionTest, PaddingIsReturnedImmediately) {
  startConnection();
  const uint32_t streamId = openStream(true);
  peer.writeHeaders(streamId, kResponse, false);
  const std::array<std::byte, 10> padding{};
  peer.framer().writeDataPadded(streamId, false, AsBytes("abc"), padding);

  const Frame connUpdate = peer.expectFrame(FrameType::WindowUpdate);
  EXPECT_EQ(connUpdate.streamId(), 0U);
  EXPECT_EQ(connUpdate.get<WindowUpdateFrame>().windowSizeIncrement, 11U);
  const Frame streamUpdate = peer.expectFrame(FrameType::WindowUpdate);
  EXPECT_EQ(streamUpdate.streamId(), streamId);
  EXPECT_EQ(streamUpdate.get<WindowUpdateFrame>().windowSizeIncrement, 11U);
  EXPECT_EQ(connection->connectionRecvWindow(), (1 << 30) - 3);
}

TEST_F(ClientConnectionTest, StreamWindowOverrunIsConnectionError) {
  startConnection(Http2Config{}.withInitialWindowSize(65535));
  const uint32_t streamId = openStream(true);
  peer.writeHeaders(streamId, kResponse, false);
  const std::vector<std::byte> chunk(16384);
  for (int idx = 0; idx < 4; ++idx) {
    peer.framer().writeData(streamId, false, chunk);
  }
  expectGoAway(ErrorCode::FlowControlError);
}

TEST_F(ClientConnectionTest, StreamWindowOverflowResetsStream) {
  startConnection();
  const uint32_t streamId = openStream();
  peer.framer().writeWindowUpdate(streamId, kMaxWindowSize);

  const Frame rst = peer.expectFrame(FrameType::RstStream);
  EXPECT_EQ(rst.streamId(), streamId);
  EXPECT_EQ(rst.get<RstStreamFrame>().errorCode, ErrorCode::FlowControlError);
  EXPECT_THROW(connection->writeData(streamId, AsBytes("x"), true), StreamError);
  EXPECT_FALSE(connection->isClosed());
}

TEST_F(ClientConnectionTest, ConnectionWindowOverflowIsConnectionError) {
  startConnection();
  peer.framer().writeWindowUpdate(0, kMaxWindowSize);
  expectGoAway(ErrorCode::FlowControlError);
}

// ============================
// Stream lifecycle
// ============================

TEST_F(ClientConnectionTest, CancelUnblocksReaderAndResetsOnce) {
  startConnection();
  const uint32_t streamId = openStream();

  std::jthread reader([&] {
    std::array<std::byte, 16> buf;
    EXPECT_THROW(static_cast<void>(connection->readData(streamId, buf)), CanceledError);
  });
  std::this_thread::sleep_for(50ms);
  connection->cancelStream(streamId);
  connection->cancelStream(streamId);
  connection->closeStream(streamId);
  reader.join();

  // The next HEADERS proves every frame written by the cancellations was seen.
  const uint32_t nextStreamId = connection->openStream(kRequest, true);
  int nbResets = 0;
  while (true) {
    const Frame frame = peer.readFrame();
    if (frame.type() == FrameType::RstStream) {
      EXPECT_EQ(frame.streamId(), streamId);
      EXPECT_EQ(frame.get<RstStreamFrame>().errorCode, ErrorCode::Cancel);
      ++nbResets;
    } else if (frame.type() == FrameType::Headers) {
      EXPECT_EQ(frame.streamId(), nextStreamId);
      break;
    }
  }
  EXPECT_EQ(nbResets, 1);
}

TEST_F(ClientConnectionTest, DataOnForgottenStreamIsRefunded) {
  startConnection();
  const uint32_t streamId = openStream(true);
  connection->cancelStream(streamId);
  ASSERT_EQ(peer.expectFrame(FrameType::RstStream).streamId(), streamId);

  const std::vector<std::byte> late(100);
  peer.framer().writeData(streamId, false, late);
  const Frame update = peer.expectFrame(FrameType::WindowUpdate);
  EXPECT_EQ(update.streamId(), 0U);
  EXPECT_EQ(update.get<WindowUpdateFrame>().windowSizeIncrement, 100U);
  EXPECT_EQ(connection->connectionRecvWindow(), 1 << 30);
  EXPECT_FALSE(connection->isClosed());
}

TEST_F(ClientConnectionTest, CancelRefundsUnreadData) {
  startConnection();
  const uint32_t streamId = openStream(true);
  peer.writeHeaders(streamId, kResponse, false);
  const std::vector<std::byte> body(500);
  peer.framer().writeData(streamId, false, body);
  EXPECT_TRUE(Eventually([this] { return connection->connectionRecvWindow() == (1 << 30) - 500; }));

  connection->closeStream(streamId);
  ASSERT_EQ(peer.expectFrame(FrameType::RstStream).get<RstStreamFrame>().errorCode, ErrorCode::Cancel);
  const Frame update = peer.expectFrame(FrameType::WindowUpdate);
  EXPECT_EQ(update.streamId(), 0U);
  EXPECT_EQ(update.get<WindowUpdateFrame>().windowSizeIncrement, 500U);
}

TEST_F(ClientConnectionTest, DataOnNeverOpenedStreamIsConnectionError) {
  startConnection();
  peer.framer().writeData(5, false, AsBytes("unexpected"));
  expectGoAway(ErrorCode::ProtocolError);
}

TEST_F(ClientConnectionTest, PeerResetStream) {
  std::atomic<uint32_t> resetStreamId{0};
  connection.emplace(sockets.client(), codec);
  connection->setOnStreamReset([&](uint32_t streamId, ErrorCode errorCode) {
    EXPECT_EQ(errorCode, ErrorCode::RefusedStream);
    resetStreamId = streamId;
  });
  connection->start();
  peer.handshake();
  expectSettingsAck();

  const uint32_t streamId = openStream();
  peer.framer().writeRstStream(streamId, ErrorCode::RefusedStream);
  try {
    static_cast<void>(connection->awaitHeaders(streamId));
    FAIL() << "expected a stream reset";
  } catch (const StreamResetError& err) {
    EXPECT_EQ(err.streamId(), streamId);
    EXPECT_EQ(err.code(), ErrorCode::RefusedStream);
  }
  EXPECT_TRUE(Eventually([&] { return resetStreamId == streamId; }));
  EXPECT_EQ(connection->activeStreamCount(), 0U);
}

TEST_F(ClientConnectionTest, MaxConcurrentStreamsBlocksOpen) {
  const std::array serverSettings{SettingsEntry{SettingsParameter::MaxConcurrentStreams, 1}};
  startConnection({}, serverSettings);
  const uint32_t firstStreamId = openStream();

  std::atomic<uint32_t> secondStreamId{0};
  std::jthread opener([&] { secondStreamId = connection->openStream(kRequest, true); });
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(secondStreamId, 0U);

  connection->closeStream(firstStreamId);
  opener.join();
  EXPECT_EQ(secondStreamId, 3U);
}

TEST_F(ClientConnectionTest, PushPromiseIsConnectionError) {
  startConnection();
  const uint32_t streamId = openStream(true);
  const ByteBuffer block = test::LiteralHeaderCodec::Encode(kRequest);
  PushPromiseParam param;
  param.streamId = streamId;
  param.promisedStreamId = 2;
  param.headerBlockFragment = block;
  param.endHeaders = true;
  peer.framer().writePushPromise(param);
  expectGoAway(ErrorCode::ProtocolError);
}

// ============================
// GOAWAY, PING, shutdown
// ============================

TEST_F(ClientConnectionTest, GoAwayRefusesStreamsAboveLastStreamId) {
  std::atomic<uint32_t> goAwayLastStreamId{0};
  connection.emplace(sockets.client(), codec);
  connection->setOnGoAway([&](uint32_t lastStreamId, ErrorCode errorCode, std::string_view debugData) {
    EXPECT_EQ(errorCode, ErrorCode::NoError);
    EXPECT_EQ(debugData, "maintenance");
    goAwayLastStreamId = lastStreamId;
  });
  connection->start();
  peer.handshake();
  expectSettingsAck();

  std::vector<uint32_t> streamIds;
  for (int idx = 0; idx < 5; ++idx) {
    streamIds.push_back(openStream());
  }
  ASSERT_EQ(streamIds.back(), 9U);

  peer.framer().writeGoAway(7, ErrorCode::NoError, AsBytes("maintenance"));
  ASSERT_TRUE(Eventually([&] { return goAwayLastStreamId == 7U; }));
  EXPECT_TRUE(connection->goAwayReceived());

  try {
    connection->writeData(9, AsBytes("x"), true);
    FAIL() << "expected stream 9 to be refused";
  } catch (const GoAwayRefusedError& err) {
    EXPECT_EQ(err.streamId(), 9U);
    EXPECT_EQ(err.lastStreamId(), 7U);
  }
  EXPECT_THROW(static_cast<void>(connection->awaitHeaders(9)), GoAwayRefusedError);
  EXPECT_THROW(connection->openStream(kRequest, true), GoAwayRefusedError);

  // Stream 5 is unaffected.
  connection->writeData(5, AsBytes("still here"), true);
  const Frame data = peer.expectFrame(FrameType::Data);
  EXPECT_EQ(data.streamId(), 5U);
  peer.writeHeaders(5, kResponse, true);
  EXPECT_EQ(connection->awaitHeaders(5), kResponse);
  connection->closeStream(5);
  EXPECT_FALSE(connection->isClosed());
  // 1, 3 and 7 are still open.
  EXPECT_EQ(connection->activeStreamCount(), 3U);
}

TEST_F(ClientConnectionTest, PingRoundTrip) {
  startConnection();
  std::chrono::nanoseconds rtt{};
  std::jthread pinger([&] { rtt = connection->ping(5s); });

  const Frame ping = peer.expectFrame(FrameType::Ping);
  EXPECT_FALSE(ping.get<PingFrame>().isAck);
  peer.framer().writePing(true, ping.get<PingFrame>().opaqueData);
  pinger.join();
  EXPECT_GT(rtt.count(), 0);
}

TEST_F(ClientConnectionTest, PingTimeout) {
  startConnection();
  EXPECT_THROW(connection->ping(20ms), PingTimeoutError);
}

TEST_F(ClientConnectionTest, FailedPingWriteIsForgotten) {
  startConnection();
  // Writes fail from now on while reads still work.
  ASSERT_EQ(::shutdown(sockets.client().fd(), SHUT_WR), 0);
  EXPECT_THROW(connection->ping(1s), TransportError);
  EXPECT_EQ(connection->pendingPingCount(), 0U);
}

TEST_F(ClientConnectionTest, PeerPingIsAcknowledged) {
  startConnection();
  const std::array<std::byte, 8> data{std::byte{'h'}, std::byte{'2'}, std::byte{'m'}, std::byte{'u'},
                                      std::byte{'x'}, std::byte{'!'}, std::byte{'!'}, std::byte{'!'}};
  peer.framer().writePing(false, data);
  const Frame ack = peer.expectFrame(FrameType::Ping);
  EXPECT_TRUE(ack.get<PingFrame>().isAck);
  EXPECT_EQ(ack.get<PingFrame>().opaqueData, data);
}

TEST_F(ClientConnectionTest, ShutdownSendsGoAwayAndStopsOpeningStreams) {
  startConnection();
  connection->shutdown(ErrorCode::NoError, "done");
  const Frame goAway = peer.expectFrame(FrameType::GoAway);
  EXPECT_EQ(goAway.get<GoAwayFrame>().lastStreamId, 0U);
  EXPECT_EQ(AsStringView(goAway.get<GoAwayFrame>().debugData), "done");
  EXPECT_THROW(connection->openStream(kRequest, true), GoAwayRefusedError);
  EXPECT_FALSE(connection->isClosed());
}

TEST_F(ClientConnectionTest, CloseUnblocksWaiters) {
  startConnection();
  const uint32_t streamId = openStream();

  std::jthread headersWaiter(
      [&] { EXPECT_THROW(static_cast<void>(connection->awaitHeaders(streamId)), ConnectionClosedError); });
  std::jthread pinger([&] { EXPECT_THROW(connection->ping(5s), ConnectionClosedError); });
  static_cast<void>(peer.expectFrame(FrameType::Ping));
  std::this_thread::sleep_for(50ms);

  connection->close();
  headersWaiter.join();
  pinger.join();
  EXPECT_TRUE(connection->isClosed());
  EXPECT_EQ(connection->activeStreamCount(), 0U);
  EXPECT_THROW(connection->openStream(kRequest, true), ConnectionClosedError);
  connection->close();
}

TEST_F(ClientConnectionTest, CloseReturnsWhileWriterIsBlockedOnTransport) {
  const std::array serverSettings{SettingsEntry{SettingsParameter::InitialWindowSize, kMaxWindowSize}};
  startConnection({}, serverSettings);
  peer.framer().writeWindowUpdate(0, kMaxWindowSize - kDefaultInitialWindowSize);
  ASSERT_TRUE(Eventually(
      [this] { return connection->connectionSendWindow() == static_cast<int32_t>(kMaxWindowSize); }));
  const uint32_t streamId = openStream();

  // The peer stops reading: the writer fills the socket buffers and blocks in the transport holding the write lock.
  const std::vector<std::byte> body(16U << 20);
  std::jthread writer([&] { EXPECT_THROW(connection->writeData(streamId, body, true), Http2Error); });
  std::this_thread::sleep_for(100ms);

  // The read loop now waits for the write lock to acknowledge this PING.
  const std::array<std::byte, 8> data{};
  peer.framer().writePing(false, data);
  std::this_thread::sleep_for(50ms);

  std::atomic<bool> closed{false};
  std::jthread closer([&] {
    connection->close();
    closed = true;
  });
  const bool closedInTime = Eventually([&] { return closed.load(); });
  EXPECT_TRUE(closedInTime);
  if (!closedInTime) {
    sockets.client().shutdown();
  }
  closer.join();
  writer.join();
  EXPECT_TRUE(connection->isClosed());
  EXPECT_EQ(connection->activeStreamCount(), 0U);
}

TEST_F(ClientConnectionTest, PeerCloseFailsPendingStreams) {
  startConnection();
  const uint32_t streamId = openStream();
  sockets.server().shutdown();
  try {
    static_cast<void>(connection->awaitHeaders(streamId));
    FAIL() << "expected the connection to be closed";
  } catch (const ConnectionClosedError& err) {
    EXPECT_EQ(err.code(), ErrorCode::NoError);
  }
  EXPECT_TRUE(connection->isClosed());
}

}  // namespace h2mux::http2
