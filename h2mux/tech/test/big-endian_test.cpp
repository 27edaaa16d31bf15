#include "h2mux/big-endian.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace h2mux {

TEST(BigEndian, RoundTrip16) {
  std::array<std::byte, 2> buf{};
  Write16BE(buf.data(), 0x0304);
  EXPECT_EQ(buf[0], std::byte{0x03});
  EXPECT_EQ(buf[1], std::byte{0x04});
  EXPECT_EQ(Read16BE(buf.data()), 0x0304);
}

TEST(BigEndian, Write24KeepsOnlyLowBits) {
  std::array<std::byte, 3> buf{};
  Write24BE(buf.data(), 0xFF123456U);
  EXPECT_EQ(buf[0], std::byte{0x12});
  EXPECT_EQ(buf[1], std::byte{0x34});
  EXPECT_EQ(buf[2], std::byte{0x56});
  EXPECT_EQ(Read24BE(buf.data()), 0x123456U);
}

TEST(BigEndian, RoundTrip32) {
  std::array<std::byte, 4> buf{};
  Write32BE(buf.data(), 0x80000001U);
  EXPECT_EQ(buf[0], std::byte{0x80});
  EXPECT_EQ(buf[3], std::byte{0x01});
  EXPECT_EQ(Read32BE(buf.data()), 0x80000001U);
}

TEST(BigEndian, UsableInConstantExpressions) {
  static constexpr std::array<std::byte, 4> kBytes{std::byte{0x00}, std::byte{0x00}, std::byte{0x40}, std::byte{0x00}};
  static_assert(Read32BE(kBytes.data()) == 16384U);
  static_assert(Read24BE(kBytes.data() + 1) == 16384U);
}

}  // namespace h2mux
