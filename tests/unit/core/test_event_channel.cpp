/**
 * @file test_event_channel.cpp
 * @brief Unit tests for event_channel and event_stream
 */

#include <gtest/gtest.h>

#include "pipedream/core/event_channel.h"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace pipedream::test {

using namespace std::chrono_literals;

// ============================================================================
// event_channel
// ============================================================================

class EventChannelTest : public ::testing::Test {};

TEST_F(EventChannelTest, PreservesOrder) {
    event_channel channel(8);

    EXPECT_TRUE(channel.send(progress_event{1, 10}));
    EXPECT_TRUE(channel.send(retry_event{2, 1, 3}));
    EXPECT_TRUE(channel.send(progress_event{2, 10}));

    EXPECT_EQ(event_type(*channel.receive()), upload_event_type::progress);
    EXPECT_EQ(event_type(*channel.receive()), upload_event_type::retry);
    EXPECT_EQ(std::get<progress_event>(*channel.receive()).part_number, 2);
}

TEST_F(EventChannelTest, TerminalEventClosesChannel) {
    event_channel channel(8);

    EXPECT_TRUE(channel.send(complete_event{}));
    EXPECT_TRUE(channel.is_closed());
    EXPECT_FALSE(channel.is_finished());

    EXPECT_FALSE(channel.send(progress_event{1, 1}));
    EXPECT_FALSE(channel.send(error_event{}));

    EXPECT_TRUE(channel.receive().has_value());
    EXPECT_TRUE(channel.is_finished());
    EXPECT_FALSE(channel.receive().has_value());
}

TEST_F(EventChannelTest, TryReceiveOnEmptyChannel) {
    event_channel channel;
    EXPECT_FALSE(channel.try_receive().has_value());
}

TEST_F(EventChannelTest, ReceiveForTimesOut) {
    event_channel channel;
    auto start = std::chrono::steady_clock::now();

    EXPECT_FALSE(channel.receive_for(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST_F(EventChannelTest, ZeroCapacityIsClampedToOne) {
    event_channel channel(0);
    EXPECT_EQ(channel.capacity(), 1u);
}

TEST_F(EventChannelTest, SenderBlocksWhenFull) {
    event_channel channel(1);
    ASSERT_TRUE(channel.send(progress_event{1, 1}));

    std::atomic<bool> sent{false};
    std::thread producer([&] {
        EXPECT_TRUE(channel.send(progress_event{2, 1}));
        sent = true;
    });

    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(sent.load());

    EXPECT_TRUE(channel.receive().has_value());
    producer.join();
    EXPECT_TRUE(sent.load());
    EXPECT_EQ(channel.size(), 1u);
}

TEST_F(EventChannelTest, DetachReleasesBlockedSender) {
    event_channel channel(1);
    ASSERT_TRUE(channel.send(progress_event{1, 1}));

    auto blocked = std::async(std::launch::async, [&] {
        return channel.send(progress_event{2, 1});
    });

    std::this_thread::sleep_for(20ms);
    channel.detach();

    EXPECT_FALSE(blocked.get());
    EXPECT_EQ(channel.size(), 0u);
}

// ============================================================================
// event_stream
// ============================================================================

class EventStreamTest : public ::testing::Test {};

TEST_F(EventStreamTest, DrainCollectsUntilTerminal) {
    auto channel = std::make_shared<event_channel>(2);
    auto task = std::async(std::launch::async, [channel] {
        for (int i = 1; i <= 5; ++i) {
            channel->send(progress_event{i, 100});
        }
        channel->send(complete_event{500, {}});
    });

    event_stream stream(channel, std::move(task));
    auto events = stream.drain();

    ASSERT_EQ(events.size(), 6u);
    EXPECT_EQ(std::get<complete_event>(events.back()).total_bytes, 500u);
    EXPECT_TRUE(stream.finished());
}

TEST_F(EventStreamTest, DestroyingStreamUnblocksProducer) {
    auto channel = std::make_shared<event_channel>(1);
    std::atomic<int> rejected{0};
    auto task = std::async(std::launch::async, [channel, &rejected] {
        for (int i = 1; i <= 100; ++i) {
            if (!channel->send(progress_event{i, 1})) {
                ++rejected;
            }
        }
    });

    {
        event_stream stream(channel, std::move(task));
        EXPECT_TRUE(stream.next().has_value());
    }

    EXPECT_GT(rejected.load(), 0);
}

TEST_F(EventStreamTest, StreamWithoutTask) {
    auto channel = std::make_shared<event_channel>();
    channel->send(error_event{error{error_code::invalid_configuration, "missing bucket"}, {}});

    event_stream stream(channel, std::future<void>{});

    auto first = stream.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(std::get<error_event>(*first).message(), "missing bucket");
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(EventStreamTest, MovedFromStreamIsEmpty) {
    auto channel = std::make_shared<event_channel>();
    channel->send(complete_event{});

    event_stream first(channel, std::future<void>{});
    event_stream second(std::move(first));

    EXPECT_TRUE(second.next().has_value());
}

}  // namespace pipedream::test
