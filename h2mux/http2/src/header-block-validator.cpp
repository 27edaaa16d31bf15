#include "h2mux/header-block-validator.hpp"

#include <format>
#include <string>

#include "h2mux/http2-frame-types.hpp"
#include "h2mux/http2-frame.hpp"

namespace h2mux::http2 {

HeaderBlockValidator::Verdict HeaderBlockValidator::check(FrameHeader header) noexcept {
  if (_lastHeaderStream != 0) {
    if (header.type != FrameType::Continuation) {
      return Verdict::ExpectedContinuation;
    }
    if (header.streamId != _lastHeaderStream) {
      return Verdict::WrongContinuationStream;
    }
  } else if (header.type == FrameType::Continuation) {
    return Verdict::UnexpectedContinuation;
  }

  switch (header.type) {
    case FrameType::Headers:
      [[fallthrough]];
    case FrameType::PushPromise:
      _openingType = header.type;
      [[fallthrough]];
    case FrameType::Continuation:
      _lastHeaderStream = header.hasFlag(FrameFlags::EndHeaders) ? 0 : header.streamId;
      break;
    default:
      break;
  }
  return Verdict::Ok;
}

std::string HeaderBlockValidator::describe(Verdict verdict, FrameHeader header) const {
  switch (verdict) {
    case Verdict::ExpectedContinuation:
      return std::format("got {} for stream {}; expected CONTINUATION following {} for stream {}",
                         FrameTypeName(header.type), header.streamId, FrameTypeName(_openingType), _lastHeaderStream);
    case Verdict::WrongContinuationStream:
      return std::format("got CONTINUATION for stream {}; expected stream {}", header.streamId, _lastHeaderStream);
    case Verdict::UnexpectedContinuation:
      return std::format("unexpected CONTINUATION for stream {}", header.streamId);
    default:
      return {};
  }
}

}  // namespace h2mux::http2
