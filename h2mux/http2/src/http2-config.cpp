#include "h2mux/http2-config.hpp"

#include <stdexcept>

#include "h2mux/http2-frame-types.hpp"

namespace h2mux::http2 {

void Http2Config::validate() const {
  // SETTINGS_MAX_FRAME_SIZE must be between 16384 and 16777215 (RFC 9113 §6.5.2)
  if (maxFrameSize < kMinMaxFrameSize || maxFrameSize > kMaxMaxFrameSize) {
    throw std::invalid_argument("Http2Config: maxFrameSize must be between 16384 and 16777215");
  }

  // SETTINGS_INITIAL_WINDOW_SIZE must not exceed 2^31-1 (RFC 9113 §6.5.2)
  if (initialWindowSize > kMaxWindowSize) {
    throw std::invalid_argument("Http2Config: initialWindowSize must not exceed 2147483647");
  }

  // Can only be raised from the initial 65535 with WINDOW_UPDATE
  if (connectionWindowSize < kDefaultInitialWindowSize || connectionWindowSize > kMaxWindowSize) {
    throw std::invalid_argument("Http2Config: connectionWindowSize must be between 65535 and 2147483647");
  }

  // A received PUSH_PROMISE is always a connection error
  if (enablePush) {
    throw std::invalid_argument("Http2Config: enablePush is not supported");
  }

  if (maxHeaderListSize == 0) {
    throw std::invalid_argument("Http2Config: maxHeaderListSize must be greater than 0");
  }

  if (streamWindowRefreshThreshold > initialWindowSize) {
    throw std::invalid_argument("Http2Config: streamWindowRefreshThreshold must not exceed initialWindowSize");
  }

  if (pingTimeout.count() <= 0) {
    throw std::invalid_argument("Http2Config: pingTimeout must be positive");
  }
}

}  // namespace h2mux::http2
