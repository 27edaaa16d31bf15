#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "h2mux/byte-buffer.hpp"
#include "h2mux/header-codec.hpp"

namespace h2mux::test {

// Uncompressed header block codec for tests.
// Each field is a 4-byte big-endian name length, the name, a 4-byte big-endian value length, then the value.
class LiteralHeaderCodec : public http2::HeaderBlockCodec {
 public:
  void encode(std::span<const http2::HeaderField> headers, ByteBuffer& out) override;

  std::optional<http2::HeaderList> decode(std::span<const std::byte> block) override;

  void setMaxEncoderTableSize(uint32_t maxSize) override { _maxEncoderTableSize.store(maxSize); }

  // Last table size announced by the peer, 4096 until then.
  [[nodiscard]] uint32_t maxEncoderTableSize() const noexcept { return _maxEncoderTableSize.load(); }

  // Number of header blocks decoded so far, successfully or not.
  [[nodiscard]] std::size_t nbDecodedBlocks() const noexcept { return _nbDecodedBlocks.load(); }

  static ByteBuffer Encode(std::span<const http2::HeaderField> headers);

 private:
  std::atomic<uint32_t> _maxEncoderTableSize{4096};
  std::atomic<std::size_t> _nbDecodedBlocks{0};
};

}  // namespace h2mux::test
