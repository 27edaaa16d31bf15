#include "h2mux/flow-window.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <random>

#include "h2mux/http2-frame-types.hpp"

namespace h2mux::http2 {

TEST(FlowWindow, DefaultIsProtocolDefault) {
  FlowWindow window;
  EXPECT_EQ(window.size(), 65535);
  EXPECT_EQ(window.available(), 65535U);
}

TEST(FlowWindow, TakeAndAdd) {
  FlowWindow window(1000);
  window.take(1000);
  EXPECT_EQ(window.available(), 0U);
  EXPECT_TRUE(window.add(24));
  EXPECT_EQ(window.size(), 24);
}

TEST(FlowWindow, AddRejectsOverflow) {
  FlowWindow window(static_cast<int32_t>(kMaxWindowSize) - 10);
  EXPECT_TRUE(window.add(10));
  EXPECT_FALSE(window.add(1));
  EXPECT_EQ(window.size(), static_cast<int32_t>(kMaxWindowSize));
}

TEST(FlowWindow, NegativeAfterSettingsDelta) {
  FlowWindow window(65535);
  window.take(60000);
  // Peer lowers SETTINGS_INITIAL_WINDOW_SIZE from 65535 to 1000.
  EXPECT_TRUE(window.add(1000 - 65535));
  EXPECT_EQ(window.size(), 5535 - 64535);
  EXPECT_EQ(window.available(), 0U);
  EXPECT_TRUE(window.add(60000));
  EXPECT_EQ(window.available(), 1000U);
}

TEST(FlowWindow, ConsumeDetectsOverrun) {
  FlowWindow window(100);
  EXPECT_TRUE(window.consume(60));
  EXPECT_FALSE(window.consume(41));
  EXPECT_EQ(window.size(), 40);
  EXPECT_TRUE(window.consume(40));
  EXPECT_EQ(window.size(), 0);
}

TEST(FlowWindow, Sendable) {
  FlowWindow stream(1000);
  FlowWindow connection(300);
  EXPECT_EQ(Sendable(stream, connection), 300U);
  connection.take(300);
  EXPECT_EQ(Sendable(stream, connection), 0U);
}

TEST(FlowWindow, ConservationOverRandomSequence) {
  std::mt19937 gen(42);
  std::uniform_int_distribution<uint32_t> dist(0, 5000);
  FlowWindow window(65535);
  int64_t expected = 65535;
  for (int iter = 0; iter < 10000; ++iter) {
    if (gen() % 2 == 0) {
      const uint32_t toSend = std::min(dist(gen), window.available());
      window.take(toSend);
      expected -= toSend;
    } else {
      const uint32_t increment = dist(gen) + 1;
      if (window.add(increment)) {
        expected += increment;
      } else {
        EXPECT_GT(expected + increment, static_cast<int64_t>(kMaxWindowSize));
      }
    }
    ASSERT_EQ(window.size(), expected);
    ASSERT_LE(window.size(), static_cast<int64_t>(kMaxWindowSize));
  }
}

}  // namespace h2mux::http2
