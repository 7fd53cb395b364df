#include "bridgeway/response-channels.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "bridgeway/http-header.hpp"
#include "bridgeway/message.hpp"

namespace bridgeway {

TEST(StatusChannelTest, FirstOfferWins) {
  StatusChannel channel;
  EXPECT_FALSE(channel.filled());
  EXPECT_TRUE(channel.offer(ResponseStart{201, {http::Header("x-first", "1")}}));
  EXPECT_TRUE(channel.filled());
  EXPECT_FALSE(channel.offer(ResponseStart{500, {}}));

  const ResponseStart start = channel.wait();
  EXPECT_EQ(start.status, 201);
  ASSERT_EQ(start.headers.size(), 1U);
  EXPECT_EQ(start.headers[0].name, "x-first");
}

TEST(StatusChannelTest, WaitBlocksUntilOffered) {
  StatusChannel channel;
  std::jthread producer([&channel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.offer(ResponseStart{204, {}});
  });
  EXPECT_EQ(channel.wait().status, 204);
}

TEST(BodyChannelTest, ChunksThenEndOfStream) {
  BodyChannel channel;
  EXPECT_TRUE(channel.push("a"));
  EXPECT_TRUE(channel.push("bc"));
  EXPECT_TRUE(channel.close());

  EXPECT_EQ(channel.pop(), "a");
  EXPECT_EQ(channel.pop(), "bc");
  EXPECT_EQ(channel.pop(), std::nullopt);
  // end of stream is sticky
  EXPECT_EQ(channel.pop(), std::nullopt);
}

TEST(BodyChannelTest, EmptyChunkIsNeverQueued) {
  BodyChannel channel;
  EXPECT_FALSE(channel.push(""));
  EXPECT_TRUE(channel.push("x"));
  EXPECT_TRUE(channel.close());
  EXPECT_EQ(channel.pop(), "x");
  EXPECT_EQ(channel.pop(), std::nullopt);
}

TEST(BodyChannelTest, SingleEndOfStreamMarker) {
  BodyChannel channel;
  EXPECT_FALSE(channel.closed());
  EXPECT_TRUE(channel.close());
  EXPECT_TRUE(channel.closed());
  EXPECT_FALSE(channel.close());
  EXPECT_FALSE(channel.push("late"));
  EXPECT_EQ(channel.pop(), std::nullopt);
}

TEST(BodyChannelTest, ConsumerBlocksUntilProducerAdvances) {
  BodyChannel channel;
  std::vector<std::string> received;
  std::jthread consumer([&] {
    for (auto chunk = channel.pop(); chunk; chunk = channel.pop()) {
      received.push_back(*chunk);
    }
  });

  for (int idx = 0; idx < 100; ++idx) {
    channel.push(std::to_string(idx));
  }
  channel.close();
  consumer.join();

  ASSERT_EQ(received.size(), 100U);
  for (int idx = 0; idx < 100; ++idx) {
    EXPECT_EQ(received[static_cast<std::size_t>(idx)], std::to_string(idx));
  }
}

TEST(ResponseChannelsTest, CancelFlag) {
  ResponseChannels channels;
  EXPECT_FALSE(channels.cancelRequested());
  channels.requestCancel();
  EXPECT_TRUE(channels.cancelRequested());
}

}  // namespace bridgeway
