#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/allocator/counters.h"

#include <chrono>

using namespace Sluice;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Optional;
using ::testing::Eq;

class MockPush : public IPush<int> {
public:
    MOCK_METHOD(void, Push, (std::optional<int> element), (override));
};

// CountingPusher owns its inner pusher by value; forward to a mock the test owns.
struct ForwardingPusher {
    MockPush* mock;
    void Push(std::optional<int> element) { mock->Push(std::move(element)); }
};

class CountingPusherTest : public ::testing::Test {
protected:
    void SetUp() override {
        counters_ = std::make_shared<CounterMailbox>();
        pusher_ = std::make_unique<CountingPusher<int, ForwardingPusher>>(
            ForwardingPusher{&mock_}, kChannel, counters_, Buzzer());
    }

    static constexpr size_t kChannel = 11;
    MockPush mock_;
    std::shared_ptr<CounterMailbox> counters_;
    std::unique_ptr<CountingPusher<int, ForwardingPusher>> pusher_;
};

TEST_F(CountingPusherTest, DataGoesOutBeforeProgressReport) {
    EXPECT_CALL(mock_, Push(Optional(Eq(5))))
        .WillOnce(Invoke([this](std::optional<int>) {
            // No report may be visible before the data is enqueued.
            EXPECT_FALSE(counters_->TryReceive().has_value());
        }));

    pusher_->Push(5);

    auto report = counters_->TryReceive();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->first, kChannel);
    EXPECT_EQ(report->second, Event::Pushed(1));
    EXPECT_FALSE(counters_->TryReceive().has_value());
}

TEST_F(CountingPusherTest, PushBuzzesDestination) {
    EXPECT_CALL(mock_, Push(_)).Times(1);
    pusher_->Push(1);

    // The buzzer is bound to this thread, so the token is already set.
    auto start = std::chrono::steady_clock::now();
    Buzzer::ParkCurrentThread(5s);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST_F(CountingPusherTest, FlushIsForwardedWithoutReport) {
    EXPECT_CALL(mock_, Push(Eq(std::optional<int>()))).Times(1);
    pusher_->Done();
    EXPECT_FALSE(counters_->TryReceive().has_value());
}

TEST_F(CountingPusherTest, ClosedCounterInboxDropsReport) {
    counters_->CloseReceiver();
    EXPECT_CALL(mock_, Push(_)).Times(2);
    pusher_->Push(1);
    pusher_->Push(2);
    EXPECT_FALSE(counters_->TryReceive().has_value());
}

TEST(CountingPullerTest, RecordsEverySuccessfulPull) {
    auto channel = NewProcessChannel<int>();
    auto events = std::make_shared<EventQueue>();
    CountingPuller<int, ProcessPuller<int>> puller(std::move(channel.second), 3, events);

    EXPECT_FALSE(puller.Pull().has_value());
    EXPECT_TRUE(events->empty());

    channel.first.Push(10);
    channel.first.Push(20);
    std::optional<int>& first = puller.Pull();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 10);
    std::optional<int>& second = puller.Pull();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, 20);
    EXPECT_FALSE(puller.Pull().has_value());

    ASSERT_EQ(events->size(), 2u);
    for (const auto& [key, event] : *events) {
        EXPECT_EQ(key, 3u);
        EXPECT_EQ(event, Event::Pulled(1));
    }
}

TEST(CountingPullerTest, DestroyingWrapperDisconnectsChannel) {
    auto channel = NewProcessChannel<int>();
    {
        CountingPuller<int, ProcessPuller<int>> puller(std::move(channel.second), 0, std::make_shared<EventQueue>());
    }
    EXPECT_THROW(channel.first.Push(1), TransportError);
}
