#include "h2mux/literal-header-codec.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "h2mux/big-endian.hpp"
#include "h2mux/byte-buffer.hpp"
#include "h2mux/header-codec.hpp"

namespace h2mux::test {

namespace {

void AppendString(ByteBuffer& out, std::string_view str) {
  std::byte len[4];
  Write32BE(len, static_cast<uint32_t>(str.size()));
  out.append(std::span<const std::byte>(len));
  out.append(str);
}

// Reads a length-prefixed string at 'pos', advancing it. std::nullopt if the block is truncated.
std::optional<std::string> ReadString(std::span<const std::byte> block, std::size_t& pos) {
  if (block.size() - pos < 4) {
    return std::nullopt;
  }
  const uint32_t len = Read32BE(block.data() + pos);
  pos += 4;
  if (block.size() - pos < len) {
    return std::nullopt;
  }
  std::string str(AsStringView(block.subspan(pos, len)));
  pos += len;
  return str;
}

}  // namespace

void LiteralHeaderCodec::encode(std::span<const http2::HeaderField> headers, ByteBuffer& out) {
  for (const auto& field : headers) {
    AppendString(out, field.name);
    AppendString(out, field.value);
  }
}

std::optional<http2::HeaderList> LiteralHeaderCodec::decode(std::span<const std::byte> block) {
  ++_nbDecodedBlocks;
  http2::HeaderList headers;
  std::size_t pos = 0;
  while (pos < block.size()) {
    auto name = ReadString(block, pos);
    if (!name) {
      return std::nullopt;
    }
    auto value = ReadString(block, pos);
    if (!value) {
      return std::nullopt;
    }
    headers.push_back({std::move(*name), std::move(*value)});
  }
  return headers;
}

ByteBuffer LiteralHeaderCodec::Encode(std::span<const http2::HeaderField> headers) {
  ByteBuffer out;
  LiteralHeaderCodec codec;
  codec.encode(headers, out);
  return out;
}

}  // namespace h2mux::test
