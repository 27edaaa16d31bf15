#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "h2mux/byte-buffer.hpp"

namespace h2mux::http2 {

struct HeaderField {
  std::string name;
  std::string value;

  bool operator==(const HeaderField&) const noexcept = default;
};

using HeaderList = std::vector<HeaderField>;

// Header block compression collaborator (HPACK in production).
//
// The connection treats header blocks as opaque: it encodes outgoing header lists into a block that it then splits
// into HEADERS / CONTINUATION fragments, and decodes the reassembled block of incoming ones.
// encode and setMaxEncoderTableSize run under the connection write lock, decode on its read loop only. The two sides
// may run concurrently, so encoder and decoder state must be independent.
class HeaderBlockCodec {
 public:
  virtual ~HeaderBlockCodec() = default;

  // Appends the encoded block of 'headers' to 'out'.
  virtual void encode(std::span<const HeaderField> headers, ByteBuffer& out) = 0;

  // Decodes a complete header block. std::nullopt means the block is invalid (COMPRESSION_ERROR), which is fatal
  // for the connection as the decoding context can no longer be trusted.
  virtual std::optional<HeaderList> decode(std::span<const std::byte> block) = 0;

  // Peer advertised SETTINGS_HEADER_TABLE_SIZE, bounding the encoder dynamic table.
  virtual void setMaxEncoderTableSize(uint32_t maxSize) = 0;
};

}  // namespace h2mux::http2
