// SPDX-License-Identifier: MIT

// tests/bounded_queue_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "lib/stream/bounded_queue.hpp"

using namespace streamkit;
using namespace std::chrono_literals;

TEST(BoundedQueueTest, FifoOrder) {
    BoundedQueue<int> queue(4);
    EXPECT_TRUE(queue.Push(1));
    EXPECT_TRUE(queue.Push(2));
    EXPECT_TRUE(queue.Push(3));
    EXPECT_EQ(queue.Size(), 3u);
    EXPECT_EQ(queue.Pop(), 1);
    EXPECT_EQ(queue.Pop(), 2);
    EXPECT_EQ(queue.Pop(), 3);
    EXPECT_EQ(queue.Size(), 0u);
}

TEST(BoundedQueueTest, ZeroCapacityHoldsOne) {
    BoundedQueue<int> queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
}

TEST(BoundedQueueTest, MoveOnlyItems) {
    BoundedQueue<std::unique_ptr<int>> queue(1);
    EXPECT_TRUE(queue.Push(std::make_unique<int>(7)));
    auto item = queue.Pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(**item, 7);
}

TEST(BoundedQueueTest, PushBlocksWhileFull) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.Push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        EXPECT_TRUE(queue.Push(2));
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(queue.Pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.Pop(), 2);
}

TEST(BoundedQueueTest, CloseDrainsThenEnds) {
    BoundedQueue<int> queue(4);
    queue.Push(1);
    queue.Push(2);
    queue.Close();
    EXPECT_FALSE(queue.Push(3));
    EXPECT_EQ(queue.Pop(), 1);
    EXPECT_EQ(queue.Pop(), 2);
    EXPECT_EQ(queue.Pop(), std::nullopt);
    EXPECT_EQ(queue.Pop(), std::nullopt);
}

TEST(BoundedQueueTest, CloseWakesBlockedConsumer) {
    BoundedQueue<int> queue(1);
    std::thread consumer([&] { EXPECT_EQ(queue.Pop(), std::nullopt); });
    std::this_thread::sleep_for(20ms);
    queue.Close();
    consumer.join();
}

TEST(BoundedQueueTest, AbandonUnblocksProducer) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.Push(1));

    std::atomic<bool> result{true};
    std::thread producer([&] { result = queue.Push(2); });
    std::this_thread::sleep_for(20ms);
    queue.Abandon();
    producer.join();

    EXPECT_FALSE(result.load());
    EXPECT_TRUE(queue.Abandoned());
    EXPECT_EQ(queue.Size(), 0u);
    EXPECT_FALSE(queue.Push(3));
}

TEST(BoundedQueueTest, ProducerConsumerPreservesOrder) {
    BoundedQueue<int> queue(3);
    constexpr int kItems = 1000;

    std::thread producer([&] {
        for (int i = 0; i < kItems; ++i) queue.Push(i);
        queue.Close();
    });

    std::vector<int> received;
    while (auto item = queue.Pop()) received.push_back(*item);
    producer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(kItems));
    for (int i = 0; i < kItems; ++i) EXPECT_EQ(received[i], i);
}
