#include "proxyscout/checker/ResultChannel.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

namespace proxyscout::checker {
namespace {

CheckResult resultFor(const std::string& proxy, bool working = false) {
    CheckResult result;
    result.proxy = proxy;
    result.working = working;
    return result;
}

TEST(ResultChannelTest, DeliversInPublishOrderThenEnds) {
    ResultChannel channel(4);
    ASSERT_TRUE(channel.publish(resultFor("a")));
    ASSERT_TRUE(channel.publish(resultFor("b", true)));
    EXPECT_TRUE(channel.close());

    auto first = channel.receive();
    ASSERT_TRUE(first);
    EXPECT_EQ("a", first->proxy);
    auto second = channel.receive();
    ASSERT_TRUE(second);
    EXPECT_EQ("b", second->proxy);
    EXPECT_TRUE(second->working);
    EXPECT_FALSE(channel.receive());
}

TEST(ResultChannelTest, ClosesExactlyOnce) {
    ResultChannel channel;
    EXPECT_EQ(100u, channel.capacity());
    EXPECT_FALSE(channel.closed());
    EXPECT_TRUE(channel.close());
    EXPECT_FALSE(channel.close());
    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.publish(resultFor("late")));
    EXPECT_FALSE(channel.receive());
}

TEST(ResultChannelTest, ProducerBlocksUntilConsumerDrains) {
    ResultChannel channel(1);
    constexpr int kCount = 50;

    std::thread producer([&channel]() {
        for (int i = 0; i < kCount; ++i) {
            channel.publish(resultFor(std::to_string(i)));
        }
        channel.close();
    });

    std::vector<std::string> received;
    while (auto result = channel.receive()) {
        received.push_back(result->proxy);
    }
    producer.join();

    ASSERT_EQ(static_cast<std::size_t>(kCount), received.size());
    for (int i = 0; i < kCount; ++i) {
        EXPECT_EQ(std::to_string(i), received[i]);
    }
}

TEST(ResultChannelTest, CloseWakesBlockedReceiver) {
    ResultChannel channel;
    std::thread closer([&channel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
        channel.close();
    });
    EXPECT_FALSE(channel.receive());
    closer.join();
}

} // namespace
} // namespace proxyscout::checker
