#pragma once

#include <algorithm>
#include <cstdint>

#include "h2mux/http2-frame-types.hpp"

namespace h2mux::http2 {

// Signed flow-control window (RFC 9113 §6.9).
//
// A send window may legally become negative when the peer lowers SETTINGS_INITIAL_WINDOW_SIZE, it can never
// exceed 2^31-1. The same type tracks receive windows, where consume() detects a peer overrunning it.
// Not thread-safe: owners guard it with their state lock.
class FlowWindow {
 public:
  explicit FlowWindow(int32_t initialSize = static_cast<int32_t>(kDefaultInitialWindowSize)) noexcept
      : _size(initialSize) {}

  [[nodiscard]] int32_t size() const noexcept { return _size; }

  // Bytes that may be sent right now (0 if the window is exhausted or negative).
  [[nodiscard]] uint32_t available() const noexcept { return _size > 0 ? static_cast<uint32_t>(_size) : 0U; }

  // Applies a WINDOW_UPDATE increment or a SETTINGS delta (possibly negative).
  // Returns false and leaves the window unchanged if the result would leave the legal 31-bit range.
  [[nodiscard]] bool add(int64_t delta) noexcept {
    const int64_t newSize = static_cast<int64_t>(_size) + delta;
    if (newSize > static_cast<int64_t>(kMaxWindowSize) || newSize < -static_cast<int64_t>(kMaxWindowSize)) {
      return false;
    }
    _size = static_cast<int32_t>(newSize);
    return true;
  }

  // Sender side: takes credit for bytes about to be sent.
  // Precondition: nbBytes <= available().
  void take(uint32_t nbBytes) noexcept { _size -= static_cast<int32_t>(nbBytes); }

  // Receiver side: accounts received bytes. Returns false if they overrun the window (left unchanged).
  [[nodiscard]] bool consume(uint32_t nbBytes) noexcept {
    if (static_cast<int64_t>(nbBytes) > static_cast<int64_t>(_size)) {
      return false;
    }
    _size -= static_cast<int32_t>(nbBytes);
    return true;
  }

  bool operator==(const FlowWindow&) const noexcept = default;

 private:
  int32_t _size;
};

// Bytes of DATA that may be sent on a stream: bounded by both its window and the connection window.
[[nodiscard]] inline uint32_t Sendable(const FlowWindow& stream, const FlowWindow& connection) noexcept {
  return std::min(stream.available(), connection.available());
}

}  // namespace h2mux::http2
