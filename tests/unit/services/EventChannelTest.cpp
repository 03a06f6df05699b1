/**
 * @file EventChannelTest.cpp
 * @brief Unit tests for EventChannel
 */

#include <gtest/gtest.h>

#include "services/EventChannel.hpp"
#include "fixtures/TestFixtures.hpp"

using namespace std::chrono_literals;

namespace {

TransferEvent Progress(uint64_t job_id, uint64_t bytes) {
    return ProgressEvent{.job_id = job_id, .bytes_done = bytes, .bytes_total = 100};
}

}  // namespace

// Test: events come out in publish order
TEST(EventChannelTest, Poll_ReturnsEventsInOrder) {
    EventChannel channel;
    channel.publish(StartedEvent{.job_id = 1, .bytes_total = 100});
    channel.publish(Progress(1, 50));

    EXPECT_EQ(channel.pending(), 2u);
    auto first = channel.poll();
    auto second = channel.poll();

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(std::holds_alternative<StartedEvent>(*first));
    EXPECT_EQ(std::get<ProgressEvent>(*second).bytes_done, 50u);
    EXPECT_FALSE(channel.poll().has_value());
}

// Test: wait_for times out on an empty channel
TEST(EventChannelTest, WaitFor_Empty_TimesOut) {
    EventChannel channel;
    auto start = std::chrono::steady_clock::now();

    auto event = channel.wait_for(20ms);

    EXPECT_FALSE(event.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

// Test: wait_for wakes when another thread publishes
TEST(EventChannelTest, WaitFor_PublishFromOtherThread_WakesUp) {
    EventChannel channel;
    std::thread producer([&channel] {
        std::this_thread::sleep_for(20ms);
        channel.publish(Progress(2, 10));
    });

    auto event = channel.wait_for(5000ms);
    producer.join();

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(std::get<ProgressEvent>(*event).job_id, 2u);
}

// Test: close wakes waiters and drops later events
TEST(EventChannelTest, Close_WakesWaitersAndDropsLaterEvents) {
    EventChannel channel;
    std::thread closer([&channel] {
        std::this_thread::sleep_for(20ms);
        channel.close();
    });

    EXPECT_TRUE(ThreadingTestHelper::WaitFor([&channel] { return channel.wait_for(10000ms); },
                                             std::chrono::milliseconds{3000}));
    closer.join();

    channel.publish(Progress(1, 1));
    EXPECT_TRUE(channel.is_closed());
    EXPECT_EQ(channel.pending(), 0u);
}

// Test: subscribers see every event; unsubscribed ones stop
TEST(EventChannelTest, Subscribe_ReceivesUntilUnsubscribed) {
    EventChannel channel;
    std::vector<TransferEvent> seen;
    auto id = channel.subscribe([&seen](const TransferEvent& event) { seen.push_back(event); });

    channel.publish(Progress(1, 10));
    channel.unsubscribe(id);
    channel.publish(Progress(1, 20));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(std::get<ProgressEvent>(seen[0]).bytes_done, 10u);
}

// Test: a subscriber may unsubscribe itself from inside the callback
TEST(EventChannelTest, Subscribe_UnsubscribeInsideCallback_DoesNotDeadlock) {
    EventChannel channel;
    int calls = 0;
    EventChannel::SubscriptionId id = 0;
    id = channel.subscribe([&](const TransferEvent&) {
        ++calls;
        channel.unsubscribe(id);
    });

    channel.publish(Progress(1, 1));
    channel.publish(Progress(1, 2));

    EXPECT_EQ(calls, 1);
}

// Test: an unbuffered channel only pushes
TEST(EventChannelTest, Publish_Unbuffered_DoesNotQueue) {
    EventChannel channel(false);
    int calls = 0;
    channel.subscribe([&calls](const TransferEvent&) { ++calls; });

    channel.publish(Progress(1, 1));

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(channel.pending(), 0u);
    EXPECT_FALSE(channel.poll().has_value());
}
