#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

#include "tiltbox/core/channel.hpp"

using namespace Channel;

TEST(ChannelTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(bounded<int>(0), std::invalid_argument);
}

TEST(ChannelTest, BoundedChannelRejectsWhenFull) {
    auto [sender, receiver] = bounded<int>(1);

    EXPECT_TRUE(sender.isEmpty());
    EXPECT_EQ(sender.trySend(1), TrySendResult::Sent);
    EXPECT_FALSE(sender.isEmpty());
    EXPECT_EQ(sender.trySend(2), TrySendResult::Full);

    auto received = receiver.tryReceive();
    ASSERT_EQ(received.status, TryReceiveStatus::Received);
    EXPECT_EQ(*received.value, 1);
    EXPECT_EQ(receiver.tryReceive().status, TryReceiveStatus::Empty);

    EXPECT_EQ(sender.trySend(3), TrySendResult::Sent);
}

TEST(ChannelTest, UnboundedChannelKeepsOrder) {
    auto [sender, receiver] = unbounded<int>();
    for (int i = 0; i < 100; ++i) {
        ASSERT_EQ(sender.trySend(i), TrySendResult::Sent);
    }
    for (int i = 0; i < 100; ++i) {
        auto received = receiver.tryReceive();
        ASSERT_EQ(received.status, TryReceiveStatus::Received);
        EXPECT_EQ(*received.value, i);
    }
    EXPECT_TRUE(receiver.isEmpty());
}

TEST(ChannelTest, DroppedReceiverDisconnectsSenders) {
    auto channel = bounded<int>(1);
    Sender<int> sender = std::move(channel.first);
    {
        Receiver<int> receiver = std::move(channel.second);
        EXPECT_TRUE(sender.isConnected());
    }
    EXPECT_FALSE(sender.isConnected());
    EXPECT_EQ(sender.trySend(1), TrySendResult::Disconnected);
}

TEST(ChannelTest, ReceiverDrainsBeforeReportingDisconnect) {
    auto channel = unbounded<int>();
    Receiver<int> receiver = std::move(channel.second);
    {
        Sender<int> sender = std::move(channel.first);
        Sender<int> copy = sender;
        EXPECT_EQ(copy.trySend(7), TrySendResult::Sent);
    }

    auto received = receiver.tryReceive();
    ASSERT_EQ(received.status, TryReceiveStatus::Received);
    EXPECT_EQ(*received.value, 7);
    EXPECT_EQ(receiver.tryReceive().status, TryReceiveStatus::Disconnected);
}

TEST(ChannelTest, CopiedSenderKeepsChannelOpen) {
    auto channel = unbounded<int>();
    Receiver<int> receiver = std::move(channel.second);
    Sender<int> copy = channel.first;
    {
        Sender<int> first = std::move(channel.first);
    }
    EXPECT_EQ(receiver.tryReceive().status, TryReceiveStatus::Empty);
    EXPECT_EQ(copy.trySend(1), TrySendResult::Sent);
}

TEST(ChannelTest, ReceiveForTimesOut) {
    auto [sender, receiver] = unbounded<int>();
    auto received = receiver.receiveFor(std::chrono::milliseconds(10));
    EXPECT_EQ(received.status, TryReceiveStatus::Empty);
    EXPECT_FALSE(received.value.has_value());
}

TEST(ChannelTest, ReceiveForWakesOnMessage) {
    auto channel = unbounded<int>();
    Receiver<int> receiver = std::move(channel.second);
    std::thread producer([sender = std::move(channel.first)]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        sender.trySend(42);
    });

    auto received = receiver.receiveFor(std::chrono::seconds(5));
    producer.join();
    ASSERT_EQ(received.status, TryReceiveStatus::Received);
    EXPECT_EQ(*received.value, 42);
}
