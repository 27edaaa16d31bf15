#include "h2mux/header-block-validator.hpp"

#include <gtest/gtest.h>

#include <cstdint>

#include "h2mux/http2-frame-types.hpp"
#include "h2mux/http2-frame.hpp"

namespace h2mux::http2 {

namespace {

using Verdict = HeaderBlockValidator::Verdict;

FrameHeader Header(FrameType type, uint8_t flags, uint32_t streamId) { return {0, type, flags, streamId}; }

}  // namespace

TEST(HeaderBlockValidator, CompleteHeadersFrameDoesNotOpenBlock) {
  HeaderBlockValidator validator;
  EXPECT_EQ(validator.check(Header(FrameType::Headers, FrameFlags::EndHeaders, 1)), Verdict::Ok);
  EXPECT_FALSE(validator.inHeaderBlock());
  EXPECT_EQ(validator.check(Header(FrameType::Data, 0, 1)), Verdict::Ok);
}

TEST(HeaderBlockValidator, HeadersThenContinuations) {
  HeaderBlockValidator validator;
  EXPECT_EQ(validator.check(Header(FrameType::Headers, 0, 3)), Verdict::Ok);
  EXPECT_TRUE(validator.inHeaderBlock());
  EXPECT_EQ(validator.openBlockStreamId(), 3U);
  EXPECT_EQ(validator.check(Header(FrameType::Continuation, 0, 3)), Verdict::Ok);
  EXPECT_EQ(validator.check(Header(FrameType::Continuation, FrameFlags::EndHeaders, 3)), Verdict::Ok);
  EXPECT_FALSE(validator.inHeaderBlock());
  EXPECT_EQ(validator.check(Header(FrameType::Data, 0, 3)), Verdict::Ok);
}

TEST(HeaderBlockValidator, DataInsideHeaderBlockIsRejected) {
  HeaderBlockValidator validator;
  ASSERT_EQ(validator.check(Header(FrameType::Headers, 0, 3)), Verdict::Ok);

  const auto data = Header(FrameType::Data, 0, 3);
  EXPECT_EQ(validator.check(data), Verdict::ExpectedContinuation);
  EXPECT_EQ(validator.describe(Verdict::ExpectedContinuation, data),
            "got DATA for stream 3; expected CONTINUATION following HEADERS for stream 3");
  // Rejection leaves the block open.
  EXPECT_EQ(validator.openBlockStreamId(), 3U);
}

TEST(HeaderBlockValidator, ConnectionFramesInsideHeaderBlockAreRejected) {
  HeaderBlockValidator validator;
  ASSERT_EQ(validator.check(Header(FrameType::Headers, 0, 1)), Verdict::Ok);
  EXPECT_EQ(validator.check(Header(FrameType::Settings, 0, 0)), Verdict::ExpectedContinuation);
  EXPECT_EQ(validator.check(Header(FrameType::Ping, 0, 0)), Verdict::ExpectedContinuation);
  EXPECT_EQ(validator.check(Header(FrameType::Headers, FrameFlags::EndHeaders, 3)), Verdict::ExpectedContinuation);
}

TEST(HeaderBlockValidator, ContinuationOnOtherStream) {
  HeaderBlockValidator validator;
  ASSERT_EQ(validator.check(Header(FrameType::Headers, 0, 1)), Verdict::Ok);
  const auto continuation = Header(FrameType::Continuation, FrameFlags::EndHeaders, 5);
  EXPECT_EQ(validator.check(continuation), Verdict::WrongContinuationStream);
  EXPECT_EQ(validator.describe(Verdict::WrongContinuationStream, continuation),
            "got CONTINUATION for stream 5; expected stream 1");
}

TEST(HeaderBlockValidator, LoneContinuation) {
  HeaderBlockValidator validator;
  const auto continuation = Header(FrameType::Continuation, FrameFlags::EndHeaders, 1);
  EXPECT_EQ(validator.check(continuation), Verdict::UnexpectedContinuation);
  EXPECT_EQ(validator.describe(Verdict::UnexpectedContinuation, continuation), "unexpected CONTINUATION for stream 1");

  // Also after a block was properly closed.
  ASSERT_EQ(validator.check(Header(FrameType::Headers, FrameFlags::EndHeaders, 1)), Verdict::Ok);
  EXPECT_EQ(validator.check(continuation), Verdict::UnexpectedContinuation);
}

TEST(HeaderBlockValidator, PushPromiseOpensBlock) {
  HeaderBlockValidator validator;
  ASSERT_EQ(validator.check(Header(FrameType::PushPromise, 0, 1)), Verdict::Ok);
  const auto data = Header(FrameType::Data, 0, 1);
  EXPECT_EQ(validator.check(data), Verdict::ExpectedContinuation);
  EXPECT_EQ(validator.describe(Verdict::ExpectedContinuation, data),
            "got DATA for stream 1; expected CONTINUATION following PUSH_PROMISE for stream 1");
}

TEST(HeaderBlockValidator, Reset) {
  HeaderBlockValidator validator;
  ASSERT_EQ(validator.check(Header(FrameType::Headers, 0, 1)), Verdict::Ok);
  validator.reset();
  EXPECT_FALSE(validator.inHeaderBlock());
  EXPECT_EQ(validator.check(Header(FrameType::Data, 0, 1)), Verdict::Ok);
}

}  // namespace h2mux::http2
