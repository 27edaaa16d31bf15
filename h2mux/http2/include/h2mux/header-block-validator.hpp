#pragma once

#include <cstdint>
#include <string>

#include "h2mux/http2-frame.hpp"

namespace h2mux::http2 {

// Enforces that header blocks are contiguous on the connection (RFC 9113 §6.10).
// A HEADERS or PUSH_PROMISE without END_HEADERS opens a block on its stream: until a frame with END_HEADERS closes
// it, only CONTINUATION frames of that same stream may follow.
class HeaderBlockValidator {
 public:
  enum class Verdict : uint8_t {
    Ok,
    ExpectedContinuation,    // a block is open, got another frame type
    WrongContinuationStream, // a block is open, got CONTINUATION for another stream
    UnexpectedContinuation,  // no block is open, got CONTINUATION
  };

  // Checks the next frame and, if accepted, updates the block state. A rejected frame leaves the state untouched.
  [[nodiscard]] Verdict check(FrameHeader header) noexcept;

  // Stream id of the open header block, 0 if none.
  [[nodiscard]] uint32_t openBlockStreamId() const noexcept { return _lastHeaderStream; }

  [[nodiscard]] bool inHeaderBlock() const noexcept { return _lastHeaderStream != 0; }

  void reset() noexcept { _lastHeaderStream = 0; }

  // Human readable reason for a rejection of given frame in the current state.
  [[nodiscard]] std::string describe(Verdict verdict, FrameHeader header) const;

 private:
  uint32_t _lastHeaderStream{};
  FrameType _openingType{FrameType::Headers};
};

}  // namespace h2mux::http2
