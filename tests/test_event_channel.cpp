//
// Created by cv2 on 21.01.2026.
//

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

#include "event_channel.hpp"

using namespace comb;
using namespace std::chrono_literals;

TEST(EventChannel, FullBufferDropsOldest) {
    EventChannel<int> channel(3);
    auto sub = channel.subscribe();

    for (int i = 1; i <= 5; ++i) channel.emit(i);

    EXPECT_EQ(sub->dropped(), 2u);
    EXPECT_EQ(sub->drain(), (std::vector<int>{3, 4, 5}));
    EXPECT_EQ(sub->pending(), 0u);
}

TEST(EventChannel, EventsWithoutSubscribersAreLost) {
    EventChannel<int> channel(4);
    channel.emit(1);

    auto sub = channel.subscribe();
    EXPECT_FALSE(sub->try_next());

    channel.emit(2);
    EXPECT_EQ(sub->try_next(), 2);
}

TEST(EventChannel, EverySubscriberGetsACopy) {
    EventChannel<std::string> channel(2);
    auto a = channel.subscribe();
    auto b = channel.subscribe();

    channel.emit("done");
    EXPECT_EQ(a->try_next(), "done");
    EXPECT_EQ(b->try_next(), "done");
}

TEST(EventChannel, ReleasedSubscriptionIsForgotten) {
    EventChannel<int> channel(2);
    auto kept = channel.subscribe();
    {
        auto gone = channel.subscribe();
    }
    channel.emit(7);
    EXPECT_EQ(kept->try_next(), 7);
}

TEST(EventChannel, NextWaitsForEmit) {
    EventChannel<int> channel(2);
    auto sub = channel.subscribe();

    EXPECT_FALSE(sub->next(10ms));

    std::jthread producer([&] {
        std::this_thread::sleep_for(20ms);
        channel.emit(42);
    });
    EXPECT_EQ(sub->next(2s), 42);
}

TEST(EventChannel, ZeroCapacityKeepsLatest) {
    EventChannel<int> channel(0);
    auto sub = channel.subscribe();
    channel.emit(1);
    channel.emit(2);
    EXPECT_EQ(channel.capacity(), 1u);
    EXPECT_EQ(sub->drain(), (std::vector<int>{2}));
}
